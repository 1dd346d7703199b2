#pragma once

// kiln/protocol.hpp - Host/worker frame codec and line channel.
//
// Frames are single-line JSON objects terminated by '\n':
//   worker -> host  {"type":"ready","protocol":1,"pid":N}
//   host -> worker  {"type":"action","id":N,"action":"<type>","payload":"<escaped>"}
//   worker -> host  {"type":"result","id":N,"ok":true|false,"value":"..","detail":".."}
//   host -> worker  {"type":"stop"}
//
// Exactly one result frame answers each action frame. Any other traffic is a
// protocol error on the host side and is logged then ignored.

#include <cstdint>
#include <string>

#include "kiln/types.hpp"

namespace kiln {
namespace protocol {

enum class FrameType { ready, action, result, stop, unknown };

struct Frame {
  FrameType type{FrameType::unknown};
  uint64_t id{0};
  uint32_t protocol{0};
  int pid{0};
  std::string action;
  std::string payload;
  bool ok{false};
  std::string value;
  std::string detail;
};

std::string encode_ready(int pid);
std::string encode_action(uint64_t id, const Action& action);
std::string encode_result(uint64_t id, bool ok, const std::string& value, const std::string& detail);
std::string encode_stop();

Frame decode(const std::string& line);

// ---------------------------------------------------------------------------
// LineChannel - owns one connected stream socket and exchanges frames on it.
// ---------------------------------------------------------------------------
// Reads and writes may happen on different threads; concurrent readers (or
// concurrent writers) are not supported.
class LineChannel {
 public:
  enum class ReadStatus { ok, eof, timeout, error };

  LineChannel() = default;
  explicit LineChannel(int fd) : fd_(fd) {}
  ~LineChannel();

  LineChannel(const LineChannel&) = delete;
  LineChannel& operator=(const LineChannel&) = delete;

  // timeout_ms < 0 waits indefinitely. The trailing '\n' is stripped.
  ReadStatus read_line(std::string* line, int timeout_ms);

  // Appends '\n' and writes the whole line. False once the peer is gone.
  bool write_line(const std::string& line);

  void close();

 private:
  int fd_{-1};
  std::string buffer_;
};

}  // namespace protocol
}  // namespace kiln
