#pragma once

#include "proxicloud/v1/project.pb.h"
#include "proxicloud/v1/project_service.pb.h"
#include "proxicloud/v1/project_service.grpc.pb.h"

namespace proxicloud::v1 {
}
