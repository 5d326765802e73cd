#include "folder_locks.hpp"

namespace multideploy {

std::unique_lock<std::mutex> FolderLocks::acquire(const std::string& folder) {
    std::mutex* m = nullptr;
    {
        std::lock_guard<std::mutex> lk(map_mtx_);
        auto& slot = locks_[folder];
        if (!slot)
            slot = std::make_unique<std::mutex>();
        m = slot.get();
    }
    return std::unique_lock<std::mutex>(*m);
}

} // namespace multideploy
