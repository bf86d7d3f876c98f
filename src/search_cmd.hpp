#pragma once
#include <string>
#include <vector>

namespace rekal {

int cmd_search(const std::vector<std::string>& args);
int cmd_recent(const std::vector<std::string>& args);
int cmd_session(const std::vector<std::string>& args);
int cmd_stats();
int cmd_hook(const std::vector<std::string>& args);
int cmd_init();

} // namespace rekal
