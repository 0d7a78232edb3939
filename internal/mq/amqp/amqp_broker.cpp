#include "amqp_broker.hpp"

#include <rabbitmq-c/ssl_socket.h>
#include <rabbitmq-c/tcp_socket.h>

#include <sys/time.h>

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sda::mq::amqp {

namespace {

using observability::IntField;
using observability::StringField;

constexpr int  kFrameMax             = 131072;
constexpr auto kConfirmTimeout       = std::chrono::seconds(30);
constexpr long kConsumePollSeconds   = 1;
constexpr int  kDefaultPort          = 5672;
constexpr int  kDefaultTlsPort       = 5671;
constexpr int  kDefaultPrefetchCount = 1;

std::string BytesToString(amqp_bytes_t bytes) {
  return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

amqp_bytes_t StringBytes(const std::string& value) {
  amqp_bytes_t bytes;
  bytes.len   = value.size();
  bytes.bytes = const_cast<char*>(value.data());
  return bytes;
}

std::string DescribeReply(const amqp_rpc_reply_t& reply) {
  switch (reply.reply_type) {
    case AMQP_RESPONSE_NORMAL:
      return "ok";
    case AMQP_RESPONSE_NONE:
      return "missing RPC reply";
    case AMQP_RESPONSE_LIBRARY_EXCEPTION:
      return amqp_error_string2(reply.library_error);
    case AMQP_RESPONSE_SERVER_EXCEPTION:
      if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
        const auto* m = static_cast<amqp_connection_close_t*>(reply.reply.decoded);
        return "connection closed by server: " + std::to_string(m->reply_code) + " " + BytesToString(m->reply_text);
      }
      if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
        const auto* m = static_cast<amqp_channel_close_t*>(reply.reply.decoded);
        return "channel closed by server: " + std::to_string(m->reply_code) + " " + BytesToString(m->reply_text);
      }
      return "server exception, method " + std::to_string(reply.reply.id);
  }
  return "unknown reply";
}

} // namespace

void AmqpBroker::ConnectionDeleter::operator()(amqp_connection_state_t conn) const {
  amqp_destroy_connection(conn);
}

AmqpBroker::AmqpBroker(const sda::runtime::config::BrokerConfig& config)
    : config_(config), conn_(amqp_new_connection()), confirms_(!config.has_publish_confirms() || config.publish_confirms()) {
  if (!conn_) throw std::runtime_error("amqp: cannot allocate connection");
  Connect();
}

AmqpBroker::~AmqpBroker() {
  if (Lost()) return;
  amqp_channel_close(conn_.get(), channel_, AMQP_REPLY_SUCCESS);
  amqp_connection_close(conn_.get(), AMQP_REPLY_SUCCESS);
}

void AmqpBroker::Connect() {
  const bool verify_peer = !config_.has_verify_peer() || config_.verify_peer();
  const int  port        = config_.port() != 0 ? static_cast<int>(config_.port()) : (config_.ssl() ? kDefaultTlsPort : kDefaultPort);

  amqp_socket_t* socket = nullptr;
  if (config_.ssl()) {
    socket = amqp_ssl_socket_new(conn_.get());
    if (socket == nullptr) throw std::runtime_error("amqp: cannot create TLS socket");

    if (amqp_ssl_socket_set_ssl_versions(socket, AMQP_TLSv1_2, AMQP_TLSvLATEST) != AMQP_STATUS_OK) {
      throw std::runtime_error("amqp: cannot require TLS 1.2");
    }
    if (!config_.cacert().empty() && amqp_ssl_socket_set_cacert(socket, config_.cacert().c_str()) != AMQP_STATUS_OK) {
      throw std::runtime_error("amqp: cannot load CA certificate " + config_.cacert());
    }
    if (!config_.client_cert().empty() && !config_.client_key().empty() &&
        amqp_ssl_socket_set_key(socket, config_.client_cert().c_str(), config_.client_key().c_str()) != AMQP_STATUS_OK) {
      throw std::runtime_error("amqp: cannot load client certificate " + config_.client_cert());
    }
    amqp_ssl_socket_set_verify_peer(socket, verify_peer ? 1 : 0);
    amqp_ssl_socket_set_verify_hostname(socket, verify_peer ? 1 : 0);
    if (!verify_peer) {
      SDA_LOG_WARN("amqp: TLS peer verification disabled", {StringField("host", config_.host())});
    }
  } else {
    socket = amqp_tcp_socket_new(conn_.get());
    if (socket == nullptr) throw std::runtime_error("amqp: cannot create socket");
  }

  const int status = amqp_socket_open(socket, config_.host().c_str(), port);
  if (status != AMQP_STATUS_OK) {
    throw std::runtime_error("amqp: cannot connect to " + config_.host() + ":" + std::to_string(port) + ": " +
                             amqp_error_string2(status));
  }

  const std::string vhost = config_.vhost().empty() ? "/" : config_.vhost();
  CheckReply(amqp_login(conn_.get(), vhost.c_str(), 0, kFrameMax, static_cast<int>(config_.heartbeat_seconds()), AMQP_SASL_METHOD_PLAIN,
                        config_.user().c_str(), config_.password().c_str()),
             "login");

  amqp_channel_open(conn_.get(), channel_);
  CheckReply(amqp_get_rpc_reply(conn_.get()), "channel.open");

  const auto prefetch = config_.prefetch_count() != 0 ? static_cast<uint16_t>(config_.prefetch_count()) : kDefaultPrefetchCount;
  amqp_basic_qos(conn_.get(), channel_, 0, prefetch, 0);
  CheckReply(amqp_get_rpc_reply(conn_.get()), "basic.qos");

  if (confirms_) {
    amqp_confirm_select(conn_.get(), channel_);
    CheckReply(amqp_get_rpc_reply(conn_.get()), "confirm.select");
  }

  amqp_basic_consume(conn_.get(), channel_, StringBytes(config_.queue()), amqp_empty_bytes, 0, 0, 0, amqp_empty_table);
  CheckReply(amqp_get_rpc_reply(conn_.get()), "basic.consume");

  SDA_LOG_INFO("amqp: consuming",
               {StringField("host", config_.host()), IntField("port", port), StringField("vhost", vhost), StringField("queue", config_.queue()),
                IntField("prefetch", prefetch), observability::BoolField("confirms", confirms_)});
}

void AmqpBroker::CheckReply(const amqp_rpc_reply_t& reply, const std::string& context) {
  if (reply.reply_type == AMQP_RESPONSE_NORMAL) return;
  throw std::runtime_error("amqp: " + context + " failed: " + DescribeReply(reply));
}

std::optional<Delivery> AmqpBroker::NextDelivery() {
  while (!closing_.load() && !Lost()) {
    amqp_maybe_release_buffers(conn_.get());

    amqp_envelope_t envelope;
    timeval         timeout{kConsumePollSeconds, 0};
    const auto      reply = amqp_consume_message(conn_.get(), &envelope, &timeout, 0);

    if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
      std::string correlation_id;
      if (envelope.message.properties._flags & AMQP_BASIC_CORRELATION_ID_FLAG) {
        correlation_id = BytesToString(envelope.message.properties.correlation_id);
      }
      Delivery delivery(this, envelope.delivery_tag, BytesToString(envelope.message.body), std::move(correlation_id));
      amqp_destroy_envelope(&envelope);
      return delivery;
    }

    if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
      if (reply.library_error == AMQP_STATUS_TIMEOUT) continue;
      if (reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
        amqp_frame_t frame;
        if (amqp_simple_wait_frame(conn_.get(), &frame) == AMQP_STATUS_OK && HandleStrayFrame(frame)) continue;
      }
    }

    MarkLost(DescribeReply(reply));
  }
  return std::nullopt;
}

bool AmqpBroker::HandleStrayFrame(const amqp_frame_t& frame) {
  if (frame.frame_type != AMQP_FRAME_METHOD) return true;

  switch (frame.payload.method.id) {
    case AMQP_BASIC_ACK_METHOD:
    case AMQP_BASIC_NACK_METHOD:
      return true;
    case AMQP_BASIC_RETURN_METHOD: {
      amqp_message_t message;
      const auto     reply = amqp_read_message(conn_.get(), frame.channel, &message, 0);
      if (reply.reply_type != AMQP_RESPONSE_NORMAL) return false;
      SDA_LOG_WARN("amqp: message returned unroutable");
      amqp_destroy_message(&message);
      return true;
    }
    case AMQP_CHANNEL_CLOSE_METHOD:
    case AMQP_CONNECTION_CLOSE_METHOD:
      return false;
    default:
      return true;
  }
}

void AmqpBroker::Publish(const std::string& correlation_id, const std::string& exchange, const std::string& routing_key, bool durable,
                         const std::string& body) {
  if (Lost()) throw util::PublishError("amqp: connection lost");

  amqp_basic_properties_t props;
  props._flags        = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
  props.content_type  = amqp_cstring_bytes("application/json");
  props.delivery_mode = durable ? AMQP_DELIVERY_PERSISTENT : AMQP_DELIVERY_NONPERSISTENT;
  if (!correlation_id.empty()) {
    props._flags |= AMQP_BASIC_CORRELATION_ID_FLAG;
    props.correlation_id = StringBytes(correlation_id);
  }

  const int status = amqp_basic_publish(conn_.get(), channel_, StringBytes(exchange), StringBytes(routing_key), 0, 0, &props, StringBytes(body));
  if (status != AMQP_STATUS_OK) {
    if (status == AMQP_STATUS_SOCKET_ERROR || status == AMQP_STATUS_CONNECTION_CLOSED) MarkLost(amqp_error_string2(status));
    throw util::PublishError(std::string("amqp: publish failed: ") + amqp_error_string2(status));
  }

  ++publish_sequence_;
  if (confirms_) AwaitConfirm(publish_sequence_);
}

/*
  With prefetch 1 the broker sends no new delivery while ours is
  unacked, so frames arriving here are confirms, returns or closes.
*/
void AmqpBroker::AwaitConfirm(uint64_t sequence) {
  const auto deadline = std::chrono::steady_clock::now() + kConfirmTimeout;

  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) throw util::PublishError("amqp: no publisher confirm within timeout");

    timeval timeout{static_cast<long>(remaining.count() / 1000000), static_cast<long>(remaining.count() % 1000000)};
    amqp_frame_t frame;
    const int    status = amqp_simple_wait_frame_noblock(conn_.get(), &frame, &timeout);
    if (status == AMQP_STATUS_TIMEOUT) throw util::PublishError("amqp: no publisher confirm within timeout");
    if (status != AMQP_STATUS_OK) {
      MarkLost(amqp_error_string2(status));
      throw util::PublishError(std::string("amqp: waiting for confirm: ") + amqp_error_string2(status));
    }
    if (frame.frame_type != AMQP_FRAME_METHOD) continue;

    if (frame.payload.method.id == AMQP_BASIC_ACK_METHOD) {
      const auto* ack = static_cast<amqp_basic_ack_t*>(frame.payload.method.decoded);
      if (ack->delivery_tag == sequence || (ack->multiple && ack->delivery_tag >= sequence)) return;
      continue;
    }
    if (frame.payload.method.id == AMQP_BASIC_NACK_METHOD) {
      const auto* nack = static_cast<amqp_basic_nack_t*>(frame.payload.method.decoded);
      if (nack->delivery_tag == sequence || (nack->multiple && nack->delivery_tag >= sequence)) {
        throw util::PublishError("amqp: broker rejected publish");
      }
      continue;
    }
    if (!HandleStrayFrame(frame)) {
      MarkLost("channel closed while waiting for confirm");
      throw util::PublishError("amqp: channel closed while waiting for confirm");
    }
  }
}

void AmqpBroker::Ack(uint64_t delivery_tag) {
  const int status = amqp_basic_ack(conn_.get(), channel_, delivery_tag, 0);
  if (status != AMQP_STATUS_OK) {
    throw util::TransientIOError(std::string("amqp: ack failed: ") + amqp_error_string2(status));
  }
}

void AmqpBroker::Nack(uint64_t delivery_tag, bool requeue) {
  const int status = amqp_basic_nack(conn_.get(), channel_, delivery_tag, 0, requeue ? 1 : 0);
  if (status != AMQP_STATUS_OK) {
    throw util::TransientIOError(std::string("amqp: nack failed: ") + amqp_error_string2(status));
  }
}

std::optional<std::string> AmqpBroker::WaitForConnectionLoss() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return closed_ || lost_.has_value(); });
  return lost_;
}

void AmqpBroker::Close() {
  closing_.store(true);
  std::lock_guard lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

void AmqpBroker::MarkLost(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (lost_) return;
  SDA_LOG_ERROR("amqp: connection lost", {StringField("reason", reason)});
  lost_ = reason;
  cv_.notify_all();
}

bool AmqpBroker::Lost() const {
  std::lock_guard lock(mutex_);
  return lost_.has_value();
}

} // namespace sda::mq::amqp
