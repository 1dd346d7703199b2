#include "kiln/protocol.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <sstream>

#include "kiln/jsonlite.hpp"
#include "kiln/version.hpp"

namespace kiln {
namespace protocol {

std::string encode_ready(int pid) {
  std::ostringstream o;
  o << "{\"type\":\"ready\",\"protocol\":" << version::PROTOCOL_FRAMING_VERSION << ",\"pid\":" << pid << "}";
  return o.str();
}

std::string encode_action(uint64_t id, const Action& action) {
  std::ostringstream o;
  o << "{\"type\":\"action\",\"id\":" << id
    << ",\"action\":\"" << jsonlite::escape(action.type) << "\""
    << ",\"payload\":\"" << jsonlite::escape(action.payload) << "\"}";
  return o.str();
}

std::string encode_result(uint64_t id, bool ok, const std::string& value, const std::string& detail) {
  std::ostringstream o;
  o << "{\"type\":\"result\",\"id\":" << id
    << ",\"ok\":" << (ok ? "true" : "false")
    << ",\"value\":\"" << jsonlite::escape(value) << "\""
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
  return o.str();
}

std::string encode_stop() { return "{\"type\":\"stop\"}"; }

Frame decode(const std::string& line) {
  Frame f;
  const std::string type = jsonlite::get_string(line, "type");
  if (type == "ready") {
    f.type = FrameType::ready;
    f.protocol = static_cast<uint32_t>(jsonlite::get_u64(line, "protocol"));
    f.pid = static_cast<int>(jsonlite::get_u64(line, "pid"));
  } else if (type == "action") {
    f.type = FrameType::action;
    f.id = jsonlite::get_u64(line, "id");
    f.action = jsonlite::get_string(line, "action");
    f.payload = jsonlite::get_string(line, "payload");
  } else if (type == "result") {
    f.type = FrameType::result;
    f.id = jsonlite::get_u64(line, "id");
    f.ok = jsonlite::get_bool(line, "ok");
    f.value = jsonlite::get_string(line, "value");
    f.detail = jsonlite::get_string(line, "detail");
  } else if (type == "stop") {
    f.type = FrameType::stop;
  }
  return f;
}

// ---------------------------------------------------------------------------
// LineChannel
// ---------------------------------------------------------------------------

LineChannel::~LineChannel() { close(); }

void LineChannel::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

LineChannel::ReadStatus LineChannel::read_line(std::string* line, int timeout_ms) {
  if (fd_ < 0) return ReadStatus::error;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
  char buf[4096];
  while (true) {
    const auto nl = buffer_.find('\n');
    if (nl != std::string::npos) {
      line->assign(buffer_, 0, nl);
      buffer_.erase(0, nl + 1);
      return ReadStatus::ok;
    }

    int wait_ms = -1;
    if (timeout_ms >= 0) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) return ReadStatus::timeout;
      wait_ms = static_cast<int>(left);
    }
    pollfd pfd{fd_, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, wait_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::error;
    }
    if (pr == 0) return ReadStatus::timeout;

    const ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      // ECONNRESET is how a killed peer shows up on some kernels.
      return errno == ECONNRESET ? ReadStatus::eof : ReadStatus::error;
    }
    if (n == 0) return ReadStatus::eof;
    buffer_.append(buf, static_cast<size_t>(n));
  }
}

bool LineChannel::write_line(const std::string& line) {
  if (fd_ < 0) return false;
  std::string data = line;
  data += '\n';
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    const ssize_t n = ::send(fd_, p, left, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

}  // namespace protocol
}  // namespace kiln
