#include "generic_task.hpp"

namespace skyread {

void GenericTask::OnExecute() { task_function_(); }

}  // namespace skyread
