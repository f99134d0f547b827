#pragma once

#include "trackq/v1/queue.pb.h"
#include "trackq/v1/queue_service.pb.h"

#if TRACKQ_WITH_GRPC
#include "trackq/v1/queue_service.grpc.pb.h"
#endif
