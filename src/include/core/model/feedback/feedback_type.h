#pragma once

#include <nlohmann/json.hpp>

namespace bucketpull::core {

enum class FeedbackType {
    kBatchStarted,  // 批次开始（batch_id，任务总数，并发上限）
    kTaskStarted,   // 任务开始（源路径，目标路径，预估大小）
    kTaskProgress,  // 单个任务的采样进度（已观测字节，预估大小）
    kTaskFinished,  // 任务结束（完整的TransferOutcome）
    kBatchProgress, // 批次整体进度，由渲染定时器周期性发出
    kBatchFinished, // 批次结束（成功/跳过/失败计数）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kBatchStarted, "BatchStarted"},
                                 {FeedbackType::kTaskStarted, "TaskStarted"},
                                 {FeedbackType::kTaskProgress, "TaskProgress"},
                                 {FeedbackType::kTaskFinished, "TaskFinished"},
                                 {FeedbackType::kBatchProgress, "BatchProgress"},
                                 {FeedbackType::kBatchFinished, "BatchFinished"},
                             });

} // namespace bucketpull::core
