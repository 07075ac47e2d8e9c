// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/ws_header_source.hpp"
#include "chain/watcher_error.hpp"
#include "rpc/json_rpc.hpp"
#include "util/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <deque>
#include <fmt/format.h>
#include <future>
#include <map>
#include <memory>
#include <openssl/ssl.h>
#include <optional>
#include <type_traits>

namespace orderwatch {
namespace rpc {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;
using json = nlohmann::json;
using chain::WatcherError;
using chain::WatcherErrorCode;

namespace {

using PlainStream = websocket::stream<tcp::socket>;
using TlsStream = websocket::stream<asio::ssl::stream<tcp::socket>>;

WatcherError TransportError(const std::string &what,
                            const beast::error_code &ec) {
  return WatcherError(WatcherErrorCode::kTransport,
                      fmt::format("{}: {}", what, ec.message()));
}

std::string RpcErrorMessage(const json &error) {
  if (error.is_object()) {
    auto it = error.find("message");
    if (it != error.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return error.dump();
}

/**
 * One websocket JSON-RPC session
 *
 * Every member below the public interface is touched only on strand_.
 */
template <class Stream>
class WsConnection : public chain::HeaderConnection,
                     public std::enable_shared_from_this<WsConnection<Stream>> {
  static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

public:
  WsConnection(asio::io_context &io_context, asio::ssl::context &ssl_context,
               const Endpoint &endpoint)
      : endpoint_(endpoint), strand_(asio::make_strand(io_context)),
        resolver_(strand_) {
    if constexpr (kTls) {
      ws_ = std::make_unique<Stream>(strand_, ssl_context);
    } else {
      ws_ = std::make_unique<Stream>(strand_);
    }
  }

  // Resolve, connect, TLS and websocket handshakes. The future completes
  // when the session can carry requests.
  std::future<void> Open() {
    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> ready = promise->get_future();
    asio::dispatch(strand_, [self = this->shared_from_this(), promise] {
      self->open_promise_ = promise;
      self->resolver_.async_resolve(
          self->endpoint_.host, std::to_string(self->endpoint_.port),
          [self](const beast::error_code &ec,
                 tcp::resolver::results_type results) {
            self->OnResolve(ec, results);
          });
    });
    return ready;
  }

  void Subscribe(chain::HeaderCallback on_header,
                 chain::ClosedCallback on_closed) override {
    asio::dispatch(strand_, [self = this->shared_from_this(),
                             on_header = std::move(on_header),
                             on_closed = std::move(on_closed)]() mutable {
      self->on_header_ = std::move(on_header);
      self->on_closed_ = std::move(on_closed);
      if (self->closed_error_) {
        WatcherError error = *self->closed_error_;
        self->DeliverClosed(error);
        return;
      }
      if (self->closing_) {
        return;
      }
      self->subscribe_id_ = self->next_id_++;
      self->QueueWrite(
          MakeRequest(self->subscribe_id_, NewHeadsSubscribeCall()).dump());
    });
  }

  chain::BlockHeader FetchHeader(const chain::BlockId &id,
                                 std::chrono::milliseconds timeout) override {
    return ParseBlockHeader(Call(BlockIdToCall(id), timeout));
  }

  void Close() override {
    asio::dispatch(strand_, [self = this->shared_from_this()] {
      self->closed_delivered_ = true;
      self->CloseImpl();
    });
  }

  std::string Describe() const override { return endpoint_.ToString(); }

private:
  json Call(const RpcCall &call, std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<json>>();
    std::future<json> result = promise->get_future();
    const uint64_t id = next_id_++;
    std::string text = MakeRequest(id, call).dump();

    asio::dispatch(strand_, [self = this->shared_from_this(), id, promise,
                             text = std::move(text)]() mutable {
      if (self->closing_) {
        promise->set_exception(std::make_exception_ptr(
            WatcherError(WatcherErrorCode::kTransport, "connection closed")));
        return;
      }
      self->pending_.emplace(id, promise);
      self->QueueWrite(std::move(text));
    });

    if (result.wait_for(timeout) != std::future_status::ready) {
      asio::dispatch(strand_, [self = this->shared_from_this(), id] {
        self->pending_.erase(id);
      });
      throw WatcherError(WatcherErrorCode::kTimeout,
                         fmt::format("{} after {}ms", call.method,
                                     timeout.count()));
    }
    return result.get();
  }

  void OnResolve(const beast::error_code &ec,
                 const tcp::resolver::results_type &results) {
    if (ec) {
      return FailOpen(TransportError("resolve " + endpoint_.host, ec));
    }
    asio::async_connect(
        beast::get_lowest_layer(*ws_), results,
        [self = this->shared_from_this()](const beast::error_code &ec,
                                          const tcp::endpoint &) {
          self->OnConnect(ec);
        });
  }

  void OnConnect(const beast::error_code &ec) {
    if (ec) {
      return FailOpen(TransportError("connect " + endpoint_.ToString(), ec));
    }
    if constexpr (kTls) {
      auto &tls = ws_->next_layer();
      if (!SSL_set_tlsext_host_name(tls.native_handle(),
                                    endpoint_.host.c_str())) {
        return FailOpen(WatcherError(WatcherErrorCode::kTransport,
                                     "failed to set TLS server name"));
      }
      tls.set_verify_mode(asio::ssl::verify_peer);
      tls.set_verify_callback(
          asio::ssl::host_name_verification(endpoint_.host));
      tls.async_handshake(
          asio::ssl::stream_base::client,
          [self = this->shared_from_this()](const beast::error_code &ec) {
            if (ec) {
              return self->FailOpen(TransportError("TLS handshake", ec));
            }
            self->StartWebsocketHandshake();
          });
    } else {
      StartWebsocketHandshake();
    }
  }

  void StartWebsocketHandshake() {
    ws_->text(true);
    ws_->async_handshake(
        fmt::format("{}:{}", endpoint_.host, endpoint_.port), endpoint_.target,
        [self = this->shared_from_this()](const beast::error_code &ec) {
          if (ec) {
            return self->FailOpen(TransportError("websocket handshake", ec));
          }
          self->open_ = true;
          LOG_RPC_DEBUG("Websocket open to {}", self->endpoint_.ToString());
          self->DoRead();
          if (self->open_promise_) {
            self->open_promise_->set_value();
            self->open_promise_.reset();
          }
        });
  }

  void FailOpen(const WatcherError &error) {
    LOG_RPC_DEBUG("Opening {} failed: {}", endpoint_.ToString(), error.what());
    if (open_promise_) {
      open_promise_->set_exception(std::make_exception_ptr(error));
      open_promise_.reset();
    }
    CloseImpl();
  }

  void DoRead() {
    ws_->async_read(read_buffer_, [self = this->shared_from_this()](
                                     const beast::error_code &ec, size_t) {
      self->OnRead(ec);
    });
  }

  void OnRead(const beast::error_code &ec) {
    if (closing_) {
      return;
    }
    if (ec) {
      if (ec == websocket::error::closed) {
        Fail(WatcherError(WatcherErrorCode::kEndOfStream,
                          "server closed the websocket"));
      } else {
        Fail(TransportError("read", ec));
      }
      return;
    }
    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    HandleMessage(text);
    if (!closing_) {
      DoRead();
    }
  }

  void HandleMessage(const std::string &text) {
    json msg;
    try {
      msg = json::parse(text);
    } catch (const json::parse_error &e) {
      LOG_RPC_WARN("Discarding unparseable message from {}: {}",
                   endpoint_.ToString(), e.what());
      return;
    }
    if (!msg.is_object()) {
      return;
    }

    try {
      auto id_it = msg.find("id");
      if (id_it != msg.end() && id_it->is_number_unsigned()) {
        HandleResponse(id_it->get<uint64_t>(), msg);
        return;
      }

      auto method = msg.find("method");
      if (method != msg.end() && *method == "eth_subscription") {
        HandleNotification(msg);
      }
    } catch (const json::exception &e) {
      Fail(WatcherError(WatcherErrorCode::kTransport,
                        fmt::format("malformed message: {}", e.what())));
    }
  }

  void HandleResponse(uint64_t id, const json &msg) {
    auto error = msg.find("error");
    const bool failed = error != msg.end() && !error->is_null();

    if (id == subscribe_id_) {
      if (failed) {
        Fail(WatcherError(WatcherErrorCode::kTransport,
                          "eth_subscribe failed: " + RpcErrorMessage(*error)));
        return;
      }
      auto result = msg.find("result");
      if (result == msg.end() || !result->is_string()) {
        Fail(WatcherError(WatcherErrorCode::kTransport,
                          "eth_subscribe returned a non-string subscription id"));
        return;
      }
      subscription_ = result->get<std::string>();
      LOG_RPC_DEBUG("Subscribed to newHeads ({})", subscription_);
      return;
    }

    auto it = pending_.find(id);
    if (it == pending_.end()) {
      LOG_RPC_TRACE("Response for abandoned request {}", id);
      return;
    }
    auto promise = std::move(it->second);
    pending_.erase(it);
    if (failed) {
      promise->set_exception(std::make_exception_ptr(WatcherError(
          WatcherErrorCode::kTransport, "RPC error: " + RpcErrorMessage(*error))));
    } else {
      auto result = msg.find("result");
      promise->set_value(result != msg.end() ? *result : json());
    }
  }

  void HandleNotification(const json &msg) {
    auto params = msg.find("params");
    if (params == msg.end() || !params->is_object()) {
      return;
    }
    auto subscription = params->find("subscription");
    if (subscription_.empty() || subscription == params->end() ||
        !subscription->is_string() ||
        subscription->get<std::string>() != subscription_) {
      return;
    }
    try {
      chain::BlockHeader header = ParseBlockHeader(params->at("result"));
      LOG_RPC_TRACE("newHeads {}", header.ToString());
      if (on_header_) {
        on_header_(header);
      }
    } catch (const WatcherError &e) {
      Fail(e);
    } catch (const json::exception &e) {
      Fail(WatcherError(WatcherErrorCode::kTransport,
                        fmt::format("malformed notification: {}", e.what())));
    }
  }

  void QueueWrite(std::string text) {
    write_queue_.push_back(std::move(text));
    if (!writing_) {
      DoWrite();
    }
  }

  void DoWrite() {
    writing_ = true;
    ws_->async_write(asio::buffer(write_queue_.front()),
                    [self = this->shared_from_this()](
                        const beast::error_code &ec, size_t) {
                      self->OnWrite(ec);
                    });
  }

  void OnWrite(const beast::error_code &ec) {
    if (closing_) {
      return;
    }
    if (ec) {
      Fail(TransportError("write", ec));
      return;
    }
    write_queue_.pop_front();
    if (write_queue_.empty()) {
      writing_ = false;
    } else {
      DoWrite();
    }
  }

  // Connection-level failure: report once, then tear down
  void Fail(const WatcherError &error) {
    LOG_RPC_WARN("Connection to {} failed: {}", endpoint_.ToString(),
                 error.what());
    DeliverClosed(error);
    CloseImpl();
  }

  void DeliverClosed(const WatcherError &error) {
    if (closed_delivered_) {
      return;
    }
    if (!on_closed_) {
      closed_error_ = error; // reported once Subscribe() installs callbacks
      return;
    }
    closed_delivered_ = true;
    auto callback = std::move(on_closed_);
    on_header_ = nullptr;
    callback(error);
  }

  void CloseImpl() {
    if (closing_) {
      return;
    }
    closing_ = true;
    open_ = false;
    resolver_.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(*ws_).close(ignored);

    for (auto &[id, promise] : pending_) {
      promise->set_exception(std::make_exception_ptr(
          WatcherError(WatcherErrorCode::kTransport, "connection closed")));
    }
    pending_.clear();
    write_queue_.clear();
    if (open_promise_) {
      open_promise_->set_exception(std::make_exception_ptr(
          WatcherError(WatcherErrorCode::kTransport, "connection closed")));
      open_promise_.reset();
    }
  }

  const Endpoint endpoint_;
  asio::strand<asio::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  std::unique_ptr<Stream> ws_;
  beast::flat_buffer read_buffer_;

  std::atomic<uint64_t> next_id_{1};
  std::shared_ptr<std::promise<void>> open_promise_;
  std::map<uint64_t, std::shared_ptr<std::promise<json>>> pending_;
  std::deque<std::string> write_queue_;
  bool writing_{false};
  bool open_{false};
  bool closing_{false};

  uint64_t subscribe_id_{0};
  std::string subscription_;
  chain::HeaderCallback on_header_;
  chain::ClosedCallback on_closed_;
  std::optional<WatcherError> closed_error_;
  bool closed_delivered_{false};
};

template <class Stream>
chain::HeaderConnectionPtr OpenConnection(asio::io_context &io_context,
                                          asio::ssl::context &ssl_context,
                                          const Endpoint &endpoint,
                                          std::chrono::milliseconds timeout) {
  auto conn =
      std::make_shared<WsConnection<Stream>>(io_context, ssl_context, endpoint);
  std::future<void> ready = conn->Open();
  if (ready.wait_for(timeout) != std::future_status::ready) {
    conn->Close();
    throw WatcherError(WatcherErrorCode::kTimeout,
                       "connecting to " + endpoint.ToString());
  }
  ready.get();
  return conn;
}

} // namespace

WsHeaderSource::WsHeaderSource(const std::string &url)
    : endpoint_(ParseEndpointUrl(url)),
      ssl_context_(asio::ssl::context::tls_client),
      work_guard_(asio::make_work_guard(io_context_)) {
  ssl_context_.set_default_verify_paths();
  io_thread_ = std::thread([this] { io_context_.run(); });
}

WsHeaderSource::~WsHeaderSource() {
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

chain::HeaderConnectionPtr
WsHeaderSource::Connect(std::chrono::milliseconds timeout) {
  LOG_RPC_DEBUG("Connecting to {}", endpoint_.ToString());
  if (endpoint_.tls) {
    return OpenConnection<TlsStream>(io_context_, ssl_context_, endpoint_,
                                     timeout);
  }
  return OpenConnection<PlainStream>(io_context_, ssl_context_, endpoint_,
                                     timeout);
}

} // namespace rpc
} // namespace orderwatch
