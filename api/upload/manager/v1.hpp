#pragma once

#include "upload/manager/v1/types.pb.h"
#include "upload/manager/v1/upload_service.pb.h"

#include "upload/manager/v1/upload_service.grpc.pb.h"
