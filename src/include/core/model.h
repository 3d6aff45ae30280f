#pragma once

#include <core/model/batch_plan.h>
#include <core/model/batch_report.h>
#include <core/model/feedback.h>
#include <core/model/progress_sample.h>
#include <core/model/remote_entry.h>
#include <core/model/selection.h>
#include <core/model/transfer_outcome.h>
#include <core/model/transfer_task.h>
