#pragma once

#include "offline/worker/v1/http.pb.h"
#include "offline/worker/v1/notification.pb.h"

#include "offline/worker/v1/worker_service.pb.h"
#include "offline/worker/v1/worker_service.grpc.pb.h"
