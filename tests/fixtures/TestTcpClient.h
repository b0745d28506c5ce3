// Repository: Aqueduct
// Component: Test TCP Client
// Purpose: Raw loopback sockets for driving senders and receivers byte by byte.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_TESTS_FIXTURES_TEST_TCP_CLIENT_H_
#define AQUEDUCT_TESTS_FIXTURES_TEST_TCP_CLIENT_H_

#include <cstddef>
#include <cstdint>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <vector>

namespace aqueduct::tests::fixtures {

// TestTcpClient is a raw TCP peer on 127.0.0.1.
// RAII wrapper that closes socket on destruction.
class TestTcpClient {
 public:
  TestTcpClient() : fd_(-1) {}
  explicit TestTcpClient(int fd) : fd_(fd) {}

  ~TestTcpClient() {
    Close();
  }

  // Non-copyable, movable
  TestTcpClient(const TestTcpClient&) = delete;
  TestTcpClient& operator=(const TestTcpClient&) = delete;
  TestTcpClient(TestTcpClient&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }
  TestTcpClient& operator=(TestTcpClient&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  // Connect to a loopback port
  // Returns true on success, false on failure
  bool Connect(uint16_t port) {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      return false;
    }

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
      close(fd_);
      fd_ = -1;
      return false;
    }

    return true;
  }

  bool SendAll(const uint8_t* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
      const ssize_t sent = send(fd_, data + offset, size - offset, MSG_NOSIGNAL);
      if (sent <= 0) {
        return false;
      }
      offset += static_cast<size_t>(sent);
    }
    return true;
  }

  bool SendAll(const std::vector<uint8_t>& bytes) {
    return SendAll(bytes.data(), bytes.size());
  }

  // Reads exactly `size` bytes. Returns false on EOF, error or timeout.
  bool ReadExact(uint8_t* out, size_t size, int timeout_ms = 2000) {
    size_t offset = 0;
    while (offset < size) {
      struct pollfd pfd {};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      if (poll(&pfd, 1, timeout_ms) <= 0) {
        return false;
      }
      const ssize_t got = recv(fd_, out + offset, size - offset, 0);
      if (got <= 0) {
        return false;
      }
      offset += static_cast<size_t>(got);
    }
    return true;
  }

  // True if the peer closed the connection within `timeout_ms`.
  bool WaitForPeerClose(int timeout_ms = 2000) {
    uint8_t scratch[4096];
    while (true) {
      struct pollfd pfd {};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      if (poll(&pfd, 1, timeout_ms) <= 0) {
        return false;
      }
      const ssize_t got = recv(fd_, scratch, sizeof(scratch), 0);
      if (got <= 0) {
        return true;
      }
    }
  }

  // Close the connection
  void Close() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

  // Get the file descriptor (for testing)
  int GetFd() const {
    return fd_;
  }

  // Check if connected
  bool IsConnected() const {
    return fd_ >= 0;
  }

 private:
  int fd_;
};

// TestTcpListener stands in for a sender: it accepts one receiver on an
// ephemeral loopback port so a test can write arbitrary bytes to it.
class TestTcpListener {
 public:
  TestTcpListener() : fd_(-1), port_(0) {}

  ~TestTcpListener() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }

  TestTcpListener(const TestTcpListener&) = delete;
  TestTcpListener& operator=(const TestTcpListener&) = delete;

  bool Listen() {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      return false;
    }
    int opt = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    if (bind(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 || listen(fd_, 4) < 0) {
      return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd_, (struct sockaddr*)&addr, &len) < 0) {
      return false;
    }
    port_ = ntohs(addr.sin_port);
    return true;
  }

  // Accepts one connection. The returned client is empty on timeout.
  TestTcpClient Accept(int timeout_ms = 2000) {
    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, timeout_ms) <= 0) {
      return TestTcpClient();
    }
    return TestTcpClient(accept(fd_, nullptr, nullptr));
  }

  uint16_t port() const { return port_; }

 private:
  int fd_;
  uint16_t port_;
};

// Helper function to connect to a loopback port
inline TestTcpClient ConnectTo(uint16_t port) {
  TestTcpClient client;
  client.Connect(port);
  return client;
}

}  // namespace aqueduct::tests::fixtures

#endif  // AQUEDUCT_TESTS_FIXTURES_TEST_TCP_CLIENT_H_
