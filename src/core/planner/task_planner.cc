#include <algorithm>
#include <cctype>
#include <core/planner/task_planner.h>
#include <core/util/error.h>
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace bucketpull::core {

namespace {

std::string stripSlashes(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    while (!path.empty() && path.front() == '/') {
        path.erase(path.begin());
    }
    return path;
}

// ASCII only; non-ASCII bytes pass through unchanged.
std::string foldCase(const std::string& text) {
    std::string folded(text);
    std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return folded;
}

bool isFolderMode(SelectionMode mode) {
    return mode == SelectionMode::kSingleFolder || mode == SelectionMode::kMultipleFolders;
}

std::string_view kindName(TransferKind kind) {
    return kind == TransferKind::kFolder ? "folder" : "file";
}

} // namespace

TaskPlanner::TaskPlanner(fs::path destination_root, int thread_hint)
    : destination_root_(std::move(destination_root))
    , thread_hint_(std::max(thread_hint, 1)) {}

const RemoteEntry& TaskPlanner::resolve(const RemoteListing& listing,
                                        const std::string& path,
                                        TransferKind expected_kind) const {
    auto bare = stripSlashes(path);
    const RemoteEntry* entry = listing.Find(bare);
    if (!entry) {
        entry = listing.Find(bare + "/");
    }
    if (!entry) {
        throw PlanningError("\"" + path + "\" is not in the listing of " + listing.root);
    }
    if (entry->kind != expected_kind) {
        throw PlanningError("\"" + path + "\" is a " + std::string(kindName(entry->kind))
                            + ", expected a " + std::string(kindName(expected_kind)));
    }
    return *entry;
}

TransferTask TaskPlanner::makeTask(const RemoteListing& listing, const RemoteEntry& entry) const {
    auto relative = fs::path(stripSlashes(entry.relative_path)).lexically_normal();
    if (relative.empty() || relative == "." || relative.is_absolute()
        || *relative.begin() == "..") {
        throw PlanningError("\"" + entry.relative_path
                            + "\" would land outside the destination root");
    }
    return TransferTask{
        .source_path = listing.root + entry.relative_path,
        .destination_path = (destination_root_ / relative).string(),
        .kind = entry.kind,
        .thread_hint = thread_hint_,
    };
}

BatchPlan TaskPlanner::Plan(const Selection& selection, const RemoteListing& listing) const {
    std::vector<const RemoteEntry*> entries;

    switch (selection.mode) {
    case SelectionMode::kEverything:
        for (const auto& entry : listing.entries) {
            entries.push_back(&entry);
        }
        break;
    case SelectionMode::kSingleFile:
    case SelectionMode::kSingleFolder:
        if (selection.paths.size() != 1) {
            throw PlanningError("a single selection needs exactly one path, got "
                                + std::to_string(selection.paths.size()));
        }
        [[fallthrough]];
    case SelectionMode::kMultipleFiles:
    case SelectionMode::kMultipleFolders: {
        if (selection.paths.empty()) {
            throw PlanningError("nothing selected");
        }
        auto kind = isFolderMode(selection.mode) ? TransferKind::kFolder : TransferKind::kFile;
        std::unordered_set<std::string> seen;
        for (const auto& path : selection.paths) {
            const auto& entry = resolve(listing, path, kind);
            if (!seen.insert(entry.relative_path).second) {
                throw PlanningError("\"" + path + "\" is selected more than once");
            }
            entries.push_back(&entry);
        }
        break;
    }
    }

    std::vector<TransferTask> tasks;
    tasks.reserve(entries.size());
    // Destinations that differ only by case would overwrite each other on
    // case-insensitive filesystems.
    std::unordered_map<std::string, std::string> folded_destinations;
    for (const auto* entry : entries) {
        auto task = makeTask(listing, *entry);
        auto [it, inserted] = folded_destinations.emplace(foldCase(task.destination_path),
                                                          task.source_path);
        if (!inserted) {
            throw PlanningError("\"" + task.source_path + "\" and \"" + it->second
                                + "\" map to the same destination ignoring case: "
                                + task.destination_path);
        }
        tasks.push_back(std::move(task));
    }

    // Destination trees must be disjoint: no task may write below another's.
    for (const auto& task : tasks) {
        fs::path folded(foldCase(task.destination_path));
        for (auto parent = folded.parent_path(); parent.has_relative_path();
             parent = parent.parent_path()) {
            auto it = folded_destinations.find(parent.string());
            if (it != folded_destinations.end()) {
                throw PlanningError("\"" + task.source_path + "\" lies inside \"" + it->second
                                    + "\", their destinations overlap");
            }
        }
    }

    spdlog::info("Planned {} task(s) into {}", tasks.size(), destination_root_.string());
    return BatchPlan(std::move(tasks));
}

} // namespace bucketpull::core
