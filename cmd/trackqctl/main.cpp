#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "trackq/v1.hpp"

using namespace trackq::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  trackqctl <addr> enqueue <track|album|playlist|artist> <id> [title]\n"
            << "  trackqctl <addr> pause <id>\n"
            << "  trackqctl <addr> resume <id>\n"
            << "  trackqctl <addr> retry <id>\n"
            << "  trackqctl <addr> cancel <id>\n"
            << "  trackqctl <addr> remove <id>\n"
            << "  trackqctl <addr> get <id>\n"
            << "  trackqctl <addr> list [status] [offset] [limit]\n"
            << "  trackqctl <addr> stats\n"
            << "  trackqctl <addr> history [offset] [limit]\n"
            << "  trackqctl <addr> failed <id>\n"
            << "  trackqctl <addr> clear-completed\n"
            << "  trackqctl <addr> clear-all\n"
            << "  trackqctl <addr> watch\n";
}

static std::optional<ItemType> ParseType(const std::string& value) {
  if (value == "track") return ITEM_TYPE_TRACK;
  if (value == "album") return ITEM_TYPE_ALBUM;
  if (value == "playlist") return ITEM_TYPE_PLAYLIST;
  if (value == "artist") return ITEM_TYPE_ARTIST;
  return std::nullopt;
}

static std::optional<ItemStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return ITEM_STATUS_PENDING;
  if (value == "downloading") return ITEM_STATUS_DOWNLOADING;
  if (value == "paused") return ITEM_STATUS_PAUSED;
  if (value == "completed") return ITEM_STATUS_COMPLETED;
  if (value == "failed") return ITEM_STATUS_FAILED;
  return std::nullopt;
}

static void PrintItem(const QueueItem& item) {
  std::cout << item.id() << " type=" << ItemType_Name(item.type()) << " status=" << ItemStatus_Name(item.status())
            << " progress=" << item.progress();
  if (item.total_tracks() > 0) {
    std::cout << " tracks=" << item.completed_tracks() << "/" << item.total_tracks();
  }
  if (item.retry_count() > 0) {
    std::cout << " retries=" << item.retry_count();
  }
  if (item.partial_success()) {
    std::cout << " partial";
  }
  if (!item.title().empty()) {
    std::cout << " title=\"" << item.title() << "\"";
  }
  if (!item.error_message().empty()) {
    std::cout << " error=\"" << item.error_message() << "\"";
  }
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = QueueService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 5) return 1;

    auto type = ParseType(argv[3]);
    if (!type.has_value()) {
      std::cerr << "unsupported type: " << argv[3] << "\n";
      return 1;
    }

    EnqueueRequest req;
    req.set_type(type.value());
    req.set_id(argv[4]);
    if (argc >= 6) req.set_title(argv[5]);

    EnqueueResponse resp;
    auto            status = stub->Enqueue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintItem(resp.item());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause" || cmd == "resume" || cmd == "retry" || cmd == "cancel" || cmd == "get") {
    if (argc < 4) return 1;

    ItemRequest req;
    req.set_id(argv[3]);

    ItemResponse resp;
    grpc::Status status;
    if (cmd == "pause") {
      status = stub->Pause(&ctx, req, &resp);
    } else if (cmd == "resume") {
      status = stub->Resume(&ctx, req, &resp);
    } else if (cmd == "retry") {
      status = stub->Retry(&ctx, req, &resp);
    } else if (cmd == "cancel") {
      status = stub->Cancel(&ctx, req, &resp);
    } else {
      status = stub->Get(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    PrintItem(resp.item());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "remove") {
    if (argc < 4) return 1;

    ItemRequest req;
    req.set_id(argv[3]);

    RemoveResponse resp;
    auto           status = stub->Remove(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListRequest req;
    if (argc >= 4 && std::string(argv[3]) != "all") {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }
    if (argc >= 5) req.set_offset(static_cast<uint32_t>(std::stoul(argv[4])));
    if (argc >= 6) req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

    ListResponse resp;
    auto         status = stub->List(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& item : resp.items()) PrintItem(item);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total=" << resp.stats().total() << "\n";
    std::cout << "pending=" << resp.stats().pending() << "\n";
    std::cout << "downloading=" << resp.stats().downloading() << "\n";
    std::cout << "paused=" << resp.stats().paused() << "\n";
    std::cout << "completed=" << resp.stats().completed() << "\n";
    std::cout << "failed=" << resp.stats().failed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    HistoryRequest req;
    if (argc >= 4) req.set_offset(static_cast<uint32_t>(std::stoul(argv[3])));
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    HistoryResponse resp;
    auto            status = stub->History(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.track_id() << " " << entry.quality() << " " << entry.file_size_bytes() << "B " << entry.file_path() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "failed") {
    if (argc < 4) return 1;

    ItemRequest req;
    req.set_id(argv[3]);

    FailedTracksResponse resp;
    auto                 status = stub->FailedTracks(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& track : resp.tracks()) {
      std::cout << track.position() << " " << track.track_id() << " attempts=" << track.attempts() << " error=\""
                << track.error_message() << "\"\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear-completed" || cmd == "clear-all") {
    ClearRequest  req;
    ClearResponse resp;

    auto status = cmd == "clear-all" ? stub->ClearAll(&ctx, req, &resp) : stub->ClearCompleted(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed=" << resp.removed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    WatchRequest req;
    auto         reader = stub->Watch(&ctx, req);

    QueueItem item;
    while (reader->Read(&item)) {
      PrintItem(item);
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
