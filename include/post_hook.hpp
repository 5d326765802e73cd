#ifndef POST_HOOK_HPP
#define POST_HOOK_HPP

#include <filesystem>
#include <functional>
#include <string>

namespace multideploy {

/**
 * @brief Callback run after a successful deployment.
 *
 * Receives the absolute checkout path and returns text to report. Throwing
 * marks the hook as failed without affecting the deployment outcome.
 */
using PostDeployHook = std::function<std::string(const std::filesystem::path&)>;

/**
 * @brief Hook that executes the program at @a program with the checkout
 *        path as its only argument.
 *
 * Standard output is captured and returned. A non-zero exit status, a
 * signal or a failure to start the program throws `std::runtime_error`.
 */
PostDeployHook make_executable_hook(const std::filesystem::path& program);

} // namespace multideploy

#endif // POST_HOOK_HPP
