#pragma once

#include "bay/v1/types.pb.h"

#include "bay/v1/sandbox_service.pb.h"
#include "bay/v1/driver_service.pb.h"
#include "bay/v1/runtime_service.pb.h"

#include "bay/v1/sandbox_service.grpc.pb.h"
#include "bay/v1/driver_service.grpc.pb.h"
#include "bay/v1/runtime_service.grpc.pb.h"
