#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace ipc
{

// Longest accepted command line; longer ones are dropped unread.
constexpr std::size_t MAX_LINE = 4096;

using LineHandler = std::function<void(const std::string &)>;

// Serves one command line per connection until a QUIT line arrives, then removes the socket.
// The parent directory is created with mode 0700. Returns false if the socket cannot be set up.
bool start_server(const std::string &sock_path, const LineHandler &on_line);
// Connects, writes `line` (a trailing '\n' is added when missing) and closes.
bool send_line(const std::string &sock_path, const std::string &line);
// Leading "~" or "~/" -> $HOME. Other paths are returned unchanged.
std::string expand_user(const std::string &path);
// "QUIT" with optional surrounding blanks, any case.
bool is_quit(const std::string &line);

}  // namespace ipc
