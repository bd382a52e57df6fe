#pragma once

#include "inkvault/annotation/v1/annotation.pb.h"

namespace inkvault::v1 {
using namespace ::inkvault::annotation::v1;
}
