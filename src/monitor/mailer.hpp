#pragma once
#include "../core/timefmt.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/**
 * @brief E-mail delivery failed; the alert will be retried on a later tick
 */
struct DeliveryError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief One outgoing alert message
 */
struct MailMessage {
  std::string sender;
  std::vector<std::string> receivers;
  std::string subject;
  std::string body;

  /**
   * @brief Render as an RFC 5322 message with headers
   */
  std::string to_rfc5322() const {
    std::ostringstream os;
    os << "From: " << sender << "\r\n";
    os << "To: ";
    for (size_t i = 0; i < receivers.size(); ++i) {
      if (i) os << ", ";
      os << receivers[i];
    }
    os << "\r\n";
    os << "Subject: " << subject << "\r\n";
    os << "Date: " << timefmt::format(std::chrono::system_clock::now(), "%a, %d %b %Y %H:%M:%S %z") << "\r\n";
    os << "MIME-Version: 1.0\r\n";
    os << "Content-Type: text/plain; charset=UTF-8\r\n";
    os << "\r\n";
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
      // dot-stuffing is the MTA's job; -oi keeps a lone "." from ending input
      os << line << "\r\n";
    }
    return os.str();
  }
};

/**
 * @brief E-mail capability
 *
 * send() delivers one message to all of its receivers or throws
 * DeliveryError. Implementations must be safe to call from a helper
 * thread (the notifier bounds every call with a deadline).
 */
struct IMailer {
  virtual ~IMailer() = default;
  virtual void send(const MailMessage& msg) = 0;
};

/**
 * @brief Delivers mail through a sendmail-compatible MTA
 *
 * The message is written to an anonymous temporary file which becomes the
 * child's standard input, so an MTA that exits early cannot block or
 * SIGPIPE the monitor. The child is killed if it outlives its deadline.
 *
 * Default command: /usr/sbin/sendmail -t -oi (recipients taken from headers).
 */
class SendmailMailer : public IMailer {
private:
  std::vector<std::string> argv_;
  std::chrono::milliseconds kill_after_;

public:
  SendmailMailer(std::vector<std::string> argv, std::chrono::milliseconds kill_after)
      : argv_(std::move(argv)), kill_after_(kill_after) {
    if (argv_.empty() || argv_.front().empty()) {
      throw std::invalid_argument("mailer command is empty");
    }
  }

  void send(const MailMessage& msg) override {
    std::unique_ptr<FILE, int (*)(FILE*)> spool(std::tmpfile(), &std::fclose);
    if (!spool) {
      throw DeliveryError(std::string("cannot create mail spool file: ") + std::strerror(errno));
    }
    std::string payload = msg.to_rfc5322();
    if (std::fwrite(payload.data(), 1, payload.size(), spool.get()) != payload.size() ||
        std::fflush(spool.get()) != 0) {
      throw DeliveryError(std::string("cannot write mail spool file: ") + std::strerror(errno));
    }
    std::rewind(spool.get());
    int in_fd = fileno(spool.get());

    // argv must be built before fork; only async-signal-safe calls in the child
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
      throw DeliveryError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
      if (::dup2(in_fd, STDIN_FILENO) < 0) ::_exit(126);
      ::execvp(args[0], args.data());
      ::_exit(127);
    }

    int status = 0;
    if (!wait_with_deadline(pid, status)) {
      throw DeliveryError(argv_.front() + " did not finish within " +
                          std::to_string(kill_after_.count()) + " ms, killed");
    }
    if (WIFEXITED(status)) {
      int code = WEXITSTATUS(status);
      if (code == 127) throw DeliveryError("cannot execute " + argv_.front());
      if (code != 0) throw DeliveryError(argv_.front() + " exited with status " + std::to_string(code));
      return;
    }
    if (WIFSIGNALED(status)) {
      throw DeliveryError(argv_.front() + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    throw DeliveryError(argv_.front() + " ended abnormally");
  }

private:
  // Poll for the child until the deadline; kill and reap it if it overstays
  bool wait_with_deadline(pid_t pid, int& status) {
    auto deadline = std::chrono::steady_clock::now() + kill_after_;
    for (;;) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) return true;
      if (r < 0 && errno != EINTR) {
        throw DeliveryError(std::string("waitpid failed: ") + std::strerror(errno));
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
};
