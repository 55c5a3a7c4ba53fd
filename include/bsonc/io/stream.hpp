#pragma once

#include "bsonc/core/common.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/write.hpp>

#include <cstddef>
#include <system_error>
#include <utility>
#include <vector>

namespace bsonc::io {

/**
 * @brief 阻塞字节流抽象（Encoder/Decoder 只依赖这里的读写语义）。
 *
 * 约定：
 * - read_some 读到流结束时返回成功且 n == 0；
 * - write_all 要么写完全部字节，要么返回错误。
 */
class Stream {
 public:
  virtual ~Stream() = default;

  [[nodiscard]] virtual bool is_open() const noexcept = 0;
  virtual void close() noexcept = 0;

  virtual std::error_code read_some(core::mutable_bytes_view dst, std::size_t& n) = 0;
  virtual std::error_code write_all(core::bytes_view src) = 0;

  /**
   * @brief 读满 dst，或读到流结束为止。
   *
   * 返回成功时 n < dst.size() 表示中途遇到流结束。
   */
  std::error_code read_exactly(core::mutable_bytes_view dst, std::size_t& n);
};

/**
 * @brief 纯内存流：读取预先放入的字节，写入追加到 output()。
 */
class MemoryStream final : public Stream {
 public:
  MemoryStream() = default;
  explicit MemoryStream(std::vector<core::byte> input) : input_(std::move(input)) {}

  [[nodiscard]] bool is_open() const noexcept override { return open_; }
  void close() noexcept override { open_ = false; }

  std::error_code read_some(core::mutable_bytes_view dst, std::size_t& n) override;
  std::error_code write_all(core::bytes_view src) override;

  // 追加待读取的字节。
  void feed(core::bytes_view data);

  [[nodiscard]] const std::vector<core::byte>& output() const noexcept { return output_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return input_.size() - read_pos_; }

 private:
  std::vector<core::byte> input_{};
  std::size_t read_pos_{0};
  std::vector<core::byte> output_{};
  bool open_{true};
};

/**
 * @brief 基于 asio 同步读写的 Stream：持有 socket/描述符，析构时关闭。
 *
 * AsyncStream 可以是 asio::ip::tcp::socket 或 asio::posix::stream_descriptor 等
 * 提供 read_some(buffer, ec) 的 asio 流类型。
 */
template <class AsyncStream>
class AsioStream final : public Stream {
 public:
  explicit AsioStream(AsyncStream stream) : stream_(std::move(stream)) {}

  ~AsioStream() override { close(); }

  AsioStream(const AsioStream&) = delete;
  AsioStream& operator=(const AsioStream&) = delete;

  [[nodiscard]] bool is_open() const noexcept override { return stream_.is_open(); }

  void close() noexcept override {
    std::error_code ignored;
    stream_.close(ignored);
  }

  std::error_code read_some(core::mutable_bytes_view dst, std::size_t& n) override {
    std::error_code ec;
    n = stream_.read_some(asio::buffer(dst.data(), dst.size()), ec);
    if (ec == asio::error::eof) {
      n = 0;
      return {};
    }
    return ec;
  }

  std::error_code write_all(core::bytes_view src) override {
    std::error_code ec;
    asio::write(stream_, asio::buffer(src.data(), src.size()), ec);
    return ec;
  }

  [[nodiscard]] AsyncStream& native() noexcept { return stream_; }

 private:
  AsyncStream stream_;
};

using TcpStream = AsioStream<asio::ip::tcp::socket>;
using DescriptorStream = AsioStream<asio::posix::stream_descriptor>;

}  // namespace bsonc::io
