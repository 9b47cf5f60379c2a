// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_NET_LINK
#define H_NET_LINK

#include <stdint.h>

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "net/asio.hpp"
#include "net/frame.hpp"

namespace net {

// The live transport of one peer role. Reads are driven by whoever owns the
// socket (the poller); writes go through Write(), which may be called from
// any thread and keeps whole frames in submission order.
class Link : public std::enable_shared_from_this<Link> {
 public:
  using socket_type = asio::generic::stream_protocol::socket;

  Link(socket_type&& socket, std::string name);
  ~Link();

  Link(const Link&) = delete;
  Link& operator=(const Link&) = delete;

  socket_type& socket() { return socket_; }
  const std::string& name() const { return name_; }

  void Write(uint8_t type, std::vector<uint8_t> payload = {});
  void Write(const Frame& frame) { Write(frame.type, frame.payload); }

  // Closes the socket on its executor. Pending operations complete with
  // operation_aborted.
  void Close();

  bool closed() const { return closed_.load(std::memory_order_acquire); }

 private:
  void WriteNext();
  void OnWritten(asio::error_code ec);

  socket_type socket_;
  const std::string name_;
  std::deque<std::vector<uint8_t>> write_queue_;
  bool write_inprogress_ = false;
  std::atomic<bool> closed_{false};
};

}  // namespace net

#endif  // H_NET_LINK
