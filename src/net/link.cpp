// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "net/link.hpp"

#include "core/compiler_specific.hpp"
#include "core/logging.hpp"

namespace net {

Link::Link(socket_type&& socket, std::string name) : socket_(std::move(socket)), name_(std::move(name)) {
  VLOG(2) << name_ << ": link created";
}

Link::~Link() {
  VLOG(2) << name_ << ": link freed";
}

void Link::Write(uint8_t type, std::vector<uint8_t> payload) {
  if (closed()) {
    VLOG(1) << name_ << ": dropping write of frame type 0x" << std::hex << static_cast<int>(type) << std::dec
            << " on closed link";
    return;
  }
  std::vector<uint8_t> buf = EncodeFrame(type, payload.data(), payload.size());
  asio::post(socket_.get_executor(), [self = shared_from_this(), buf = std::move(buf)]() mutable {
    if (self->closed()) {
      return;
    }
    self->write_queue_.push_back(std::move(buf));
    if (!self->write_inprogress_) {
      self->WriteNext();
    }
  });
}

void Link::WriteNext() {
  DCHECK(!write_inprogress_);
  if (write_queue_.empty()) {
    return;
  }
  write_inprogress_ = true;
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
                    [self = shared_from_this()](asio::error_code ec, size_t /*bytes_transferred*/) {
                      self->OnWritten(ec);
                    });
}

void Link::OnWritten(asio::error_code ec) {
  write_inprogress_ = false;
  if (UNLIKELY(ec == asio::error::operation_aborted)) {
    // part of the front frame may be out already, never send it again
    VLOG(2) << name_ << ": write aborted";
    if (!write_queue_.empty()) {
      write_queue_.pop_front();
    }
    if (!closed()) {
      WriteNext();
    }
    return;
  }
  if (ec) {
    // the read side observes the same failure and reports it
    LOG(WARNING) << name_ << ": write failed: " << ec;
    write_queue_.clear();
    return;
  }
  write_queue_.pop_front();
  WriteNext();
}

void Link::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  asio::post(socket_.get_executor(), [self = shared_from_this()]() {
    asio::error_code ec;
    self->socket_.shutdown(asio::socket_base::shutdown_both, ec);
    self->socket_.close(ec);
    self->write_queue_.clear();
    VLOG(2) << self->name_ << ": link closed";
  });
}

}  // namespace net
