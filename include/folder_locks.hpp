#ifndef FOLDER_LOCKS_HPP
#define FOLDER_LOCKS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace multideploy {

/**
 * @brief One mutex per managed folder name.
 *
 * Mutexes are created on first use and live as long as the FolderLocks
 * object, so a returned lock never refers to a destroyed mutex.
 */
class FolderLocks {
  public:
    std::unique_lock<std::mutex> acquire(const std::string& folder);

  private:
    std::mutex map_mtx_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace multideploy

#endif // FOLDER_LOCKS_HPP
