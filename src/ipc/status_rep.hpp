#pragma once
#include <zmq.h>
#include <chrono>
#include <stdexcept>
#include <string>

/**
 * @brief ZeroMQ status request responder
 *
 * Answers JSON status requests between monitor ticks. The socket is only
 * polled from the monitor loop's wait, so requests are served on the loop
 * thread and never overlap a tick.
 *
 * Supported requests:
 * - {"cmd":"get_status"}
 * - {"cmd":"ping"}
 */
struct StatusRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string endpoint;

  /**
   * @brief Create and bind the responder socket
   * @param bind_address e.g. tcp://127.0.0.1:5555 or ipc:///run/room-monitor.sock
   * @throws std::runtime_error if the socket cannot be bound
   */
  explicit StatusRep(const std::string& bind_address) : endpoint(bind_address) {
    ctx = zmq_ctx_new();
    if (!ctx) throw std::runtime_error("zmq_ctx_new failed");
    rep = zmq_socket(ctx, ZMQ_REP);
    if (!rep) {
      zmq_ctx_term(ctx);
      throw std::runtime_error(std::string("zmq_socket failed: ") + zmq_strerror(zmq_errno()));
    }
    int linger = 0;
    (void)zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_bind(rep, bind_address.c_str()) != 0) {
      std::string why = zmq_strerror(zmq_errno());
      zmq_close(rep);
      zmq_ctx_term(ctx);
      throw std::runtime_error("cannot bind status endpoint " + bind_address + ": " + why);
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~StatusRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  StatusRep(const StatusRep&) = delete;
  StatusRep& operator=(const StatusRep&) = delete;

  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Wait up to @p budget for a request
   * @return true if a request is ready to recv()
   */
  bool poll(std::chrono::milliseconds budget) {
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    int rc = zmq_poll(items, 1, static_cast<long>(budget.count()));
    return rc > 0 && (items[0].revents & ZMQ_POLLIN);
  }

  /**
   * @brief Receive request (blocking). Caller must reply.
   */
  std::string recv() {
    char buf[1024];
    int n = zmq_recv(rep, buf, sizeof(buf), 0);
    if (n > static_cast<int>(sizeof(buf))) n = sizeof(buf);
    return std::string(buf, buf + (n > 0 ? n : 0));
  }

  /**
   * @brief Send reply to the received request
   */
  void reply(const std::string& s) {
    zmq_send(rep, s.data(), s.size(), 0);
  }
};
