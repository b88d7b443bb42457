#ifndef EXPORTFLOW_PROCESS_OPERATIONS_H
#define EXPORTFLOW_PROCESS_OPERATIONS_H

#include <string>

namespace exportflow {
namespace ocal {
namespace process {

/**
 * Launch an application without waiting for it
 * @param path Executable path
 * @param processId Output process id on success
 * @return true if the process was created
 */
bool launchDetached(const std::string& path, unsigned long& processId);

} // namespace process
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_PROCESS_OPERATIONS_H
