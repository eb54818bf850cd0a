#define LOOPMUX_LOG_COMPONENT "server.connection"

#include "loopmux/server/connection.h"

#include <vector>

#include "loopmux/logging/log_macros.h"
#include "loopmux/server/websocket_session.h"

namespace loopmux {
namespace server {

namespace {

constexpr int kMaxReadsPerEvent = 16;

// Hands ownership to the dispatcher so the object dies on the next loop
// iteration rather than inside one of its own callbacks
template <typename T>
void deferRelease(event::Dispatcher& dispatcher, std::unique_ptr<T>& object) {
  if (!object) {
    return;
  }
  std::shared_ptr<T> released(std::move(object));
  dispatcher.post([released]() {});
}

}  // namespace

const char* connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Accepted: return "accepted";
    case ConnectionState::Routed: return "routed";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Closing: return "closing";
    case ConnectionState::Closed: return "closed";
  }
  return "unknown";
}

Connection::Connection(uint64_t id,
                       event::Dispatcher& dispatcher,
                       network::IoSocketHandlePtr socket)
    : id_(id),
      dispatcher_(dispatcher),
      socket_(std::move(socket)),
      last_activity_(std::chrono::steady_clock::now()) {
  auto peer = socket_->peerAddress();
  if (peer.ok()) {
    peer_address_ = *peer;
  }

  // Read interest is added once callbacks are installed
  file_event_ = dispatcher_.createFileEvent(
      socket_->fd(), [this](uint32_t events) { onFileEvent(events); }, 0);
}

Connection::~Connection() {
  // Not inside any of our callbacks here; release directly
  if (heartbeat_timer_) {
    heartbeat_timer_->disableTimer();
    heartbeat_timer_.reset();
  }
  file_event_.reset();
  if (socket_) {
    socket_->close();
  }
}

void Connection::setCallbacks(ConnectionCallbacks& callbacks) {
  callbacks_ = &callbacks;
  updateEvents();
}

bool Connection::markRouted(ClientType type) {
  if (route_determined_) {
    return false;
  }
  route_determined_ = true;
  client_type_ = type;
  state_ = ConnectionState::Routed;
  return true;
}

void Connection::touch() {
  last_activity_ = std::chrono::steady_clock::now();
}

size_t Connection::pendingWriteBytes() const {
  size_t total = 0;
  for (const auto& pending : write_queue_) {
    total += pending.data.size() - pending.offset;
  }
  return total;
}

bool Connection::write(const std::string& data, WriteCompleteCb cb) {
  if (!isOpen() || state_ == ConnectionState::Closed) {
    if (cb) {
      cb(SystemError(EPIPE, "Connection closed"));
    }
    return false;
  }

  PendingWrite pending;
  pending.data = data;
  pending.cb = std::move(cb);
  write_queue_.push_back(std::move(pending));

  if (flushing_) {
    return true;
  }
  flushWrites();
  return isOpen() && state_ != ConnectionState::Closed;
}

void Connection::flushWrites() {
  flushing_ = true;
  std::vector<WriteCompleteCb> completed;

  while (!write_queue_.empty()) {
    auto& front = write_queue_.front();
    auto result = socket_->write(front.data.data() + front.offset,
                                 front.data.size() - front.offset);
    if (!result.ok()) {
      if (result.wouldBlock()) {
        break;
      }
      flushing_ = false;
      SystemError error = *result.error_info;
      LOOPMUX_CLIENT_LOG(Debug, id_, "write failed: {}", error.message);
      for (auto& cb : completed) {
        cb(std::nullopt);
      }
      failPendingWrites(error);
      if (callbacks_ && state_ != ConnectionState::Closed) {
        callbacks_->onTransportError(*this, error);
      }
      return;
    }

    front.offset += *result;
    if (front.offset == front.data.size()) {
      if (front.cb) {
        completed.push_back(std::move(front.cb));
      }
      write_queue_.pop_front();
    }
  }

  flushing_ = false;
  updateEvents();

  for (auto& cb : completed) {
    cb(std::nullopt);
  }
}

void Connection::failPendingWrites(const SystemError& error) {
  std::deque<PendingWrite> failed;
  failed.swap(write_queue_);
  for (auto& pending : failed) {
    if (pending.cb) {
      pending.cb(error);
    }
  }
}

void Connection::updateEvents() {
  if (!file_event_ || state_ == ConnectionState::Closed) {
    return;
  }
  uint32_t events = 0;
  if (callbacks_) {
    events |= event::FileReady::Read;
  }
  if (!write_queue_.empty()) {
    events |= event::FileReady::Write;
  }
  file_event_->setEnabled(events);
}

void Connection::onFileEvent(uint32_t events) {
  if (events & event::FileReady::Write) {
    flushWrites();
  }
  if (!isOpen() || state_ == ConnectionState::Closed) {
    return;
  }
  if (events & event::FileReady::Read) {
    onReadReady();
  }
}

void Connection::onReadReady() {
  if (!callbacks_) {
    return;
  }

  bool got_data = false;
  bool remote_closed = false;
  std::optional<SystemError> read_error;

  for (int i = 0; i < kMaxReadsPerEvent; ++i) {
    auto result = socket_->read(buffer_);
    if (!result.ok()) {
      if (!result.wouldBlock()) {
        read_error = *result.error_info;
      }
      break;
    }
    if (*result == 0) {
      remote_closed = true;
      break;
    }
    got_data = true;
  }

  if (got_data) {
    touch();
    callbacks_->onData(*this);
  }

  // Data that arrived with the FIN is handled before the close
  if (state_ == ConnectionState::Closed) {
    return;
  }
  if (read_error) {
    callbacks_->onTransportError(*this, *read_error);
  } else if (remote_closed) {
    callbacks_->onRemoteClose(*this);
  }
}

void Connection::close() {
  if (state_ == ConnectionState::Closed) {
    return;
  }
  state_ = ConnectionState::Closed;

  stopHeartbeat();
  write_queue_.clear();

  if (file_event_) {
    file_event_->setEnabled(0);
    deferRelease(dispatcher_, file_event_);
  }
  if (socket_) {
    socket_->close();
  }
  LOOPMUX_CLIENT_LOG(Debug, id_, "closed");
}

void Connection::startHeartbeat(std::chrono::milliseconds interval,
                                std::function<void()> on_tick) {
  stopHeartbeat();
  heartbeat_interval_ = interval;
  heartbeat_cb_ = std::move(on_tick);
  heartbeat_timer_ = dispatcher_.createTimer([this]() {
    // Copy: the tick may stop the heartbeat and reset heartbeat_cb_
    auto tick = heartbeat_cb_;
    if (tick) {
      tick();
    }
    if (heartbeat_timer_ && state_ != ConnectionState::Closed) {
      heartbeat_timer_->enableTimer(heartbeat_interval_);
    }
  });
  heartbeat_timer_->enableTimer(heartbeat_interval_);
}

void Connection::stopHeartbeat() {
  if (!heartbeat_timer_) {
    return;
  }
  heartbeat_timer_->disableTimer();
  deferRelease(dispatcher_, heartbeat_timer_);
  heartbeat_cb_ = nullptr;
}

void Connection::setWebSocketSession(
    std::unique_ptr<WebSocketSession> session) {
  websocket_session_ = std::move(session);
}

}  // namespace server
}  // namespace loopmux
