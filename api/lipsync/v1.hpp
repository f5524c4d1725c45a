#pragma once

#include "lipsync/v1/inference.pb.h"
#include "lipsync/v1/job.pb.h"
#include "lipsync/v1/task_queue.pb.h"

namespace lipsync::v1 {
}
