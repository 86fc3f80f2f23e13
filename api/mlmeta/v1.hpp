#pragma once

#include "mlmeta/v1/metadata_service.pb.h"

namespace mlmeta::api {
using namespace ::mlmeta::v1;
}
