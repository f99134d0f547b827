#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_application.hpp"
#include "trackq/v1.hpp"

namespace {

void TestErrorMapping() {
  using trackq::grpc::ToStatus;

  assert(ToStatus(trackq::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(trackq::util::DuplicateId("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(trackq::util::InvalidTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(trackq::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("disk on fire")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(trackq::util::NotFound("queue item not found: t1")).error_message() == "queue item not found: t1");
}

void TestPauseMissingItemReturnsNotFound() {
  auto                      app = trackq::testing::BuildIdleApplication();
  trackq::grpc::QueueServer server(app.queue_service);

  trackq::v1::ItemRequest req;
  req.set_id("missing");
  trackq::v1::ItemResponse resp;
  ::grpc::ServerContext    ctx;

  const auto status = server.Pause(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  app.bridge->Shutdown();
}

void TestEnqueueRoundTripAndDuplicate() {
  auto                      app = trackq::testing::BuildIdleApplication();
  trackq::grpc::QueueServer server(app.queue_service);

  trackq::v1::EnqueueRequest req;
  req.set_id("t1");
  req.set_type(trackq::v1::ITEM_TYPE_TRACK);

  trackq::v1::EnqueueResponse resp;
  ::grpc::ServerContext       ctx;
  assert(server.Enqueue(&ctx, &req, &resp).ok());
  assert(resp.item().id() == "t1");
  assert(resp.item().status() == trackq::v1::ITEM_STATUS_PENDING);

  trackq::v1::EnqueueResponse again;
  ::grpc::ServerContext       ctx2;
  assert(server.Enqueue(&ctx2, &req, &again).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  app.bridge->Shutdown();
}

void TestInvalidRequestsAreRejected() {
  auto                      app = trackq::testing::BuildIdleApplication();
  trackq::grpc::QueueServer server(app.queue_service);

  trackq::v1::EnqueueRequest untyped;
  untyped.set_id("t1");
  trackq::v1::EnqueueResponse enqueue_resp;
  ::grpc::ServerContext       ctx;
  assert(server.Enqueue(&ctx, &untyped, &enqueue_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  untyped.set_type(trackq::v1::ITEM_TYPE_TRACK);
  ::grpc::ServerContext ctx2;
  assert(server.Enqueue(&ctx2, &untyped, &enqueue_resp).ok());

  // pending items cannot be paused
  trackq::v1::ItemRequest pause;
  pause.set_id("t1");
  trackq::v1::ItemResponse pause_resp;
  ::grpc::ServerContext    ctx3;
  assert(server.Pause(&ctx3, &pause, &pause_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  app.bridge->Shutdown();
}

} // namespace

int main() {
  TestErrorMapping();
  TestPauseMissingItemReturnsNotFound();
  TestEnqueueRoundTripAndDuplicate();
  TestInvalidRequestsAreRejected();

  std::cout << "trackq_unit_grpc_status: pass\n";
  return 0;
}
