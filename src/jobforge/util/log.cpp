#include "jobforge/util/log.hpp"

#include <unistd.h>

#include <memory>
#include <optional>
#include <vector>

namespace jobforge::log {

namespace {

// Blocking on a full queue would stall worker threads when stdout is a pipe
// nobody drains (ctest); only a terminal gets the slow synchronous path.
[[nodiscard]] auto attached_to_tty(FILE *out) noexcept -> bool {
  if (out == nullptr) {
    return false;
  }
  const int fd = ::fileno(out);
  return fd >= 0 && ::isatty(fd) != 0;
}

} // namespace

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  channel_ctx_.restart();
  auto channel =
      std::make_shared<Channel>(channel_ctx_.get_executor(), kQueueCapacity);
  channel_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel = std::move(channel)] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
    channel->close();
  }
  channel_ctx_.stop();
  if (writer_.joinable()) {
    writer_.join();
  }
  // Discard handlers left queued by the writer so a later start() does not
  // run them.
  channel_ctx_.restart();
  (void)channel_ctx_.poll();
}

auto Logger::set_output_stderr() noexcept -> void {
  output_.store(stderr, std::memory_order_release);
}

auto Logger::set_output_file(std::string_view path) -> bool {
  auto channel = channel_.load(std::memory_order_acquire);
  if (!channel) {
    return reopen(std::string(path));
  }
  return channel->try_send(boost::system::error_code{},
                           Record{.text = {}, .reopen = std::string(path)});
}

auto Logger::reopen(const std::string &path) -> bool {
  if (path.empty()) {
    output_.store(stdout, std::memory_order_release);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    return true;
  }
  FILE *f = std::fopen(path.c_str(), "a");
  if (f == nullptr) {
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  output_.store(f, std::memory_order_release);
  if (file_ != nullptr) {
    std::fclose(file_);
  }
  file_ = f;
  return true;
}

auto Logger::write_now(std::string_view line) -> void {
  auto *out = output_.load(std::memory_order_acquire);
  if (out == nullptr) {
    out = stdout;
  }
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

auto Logger::submit(std::string line) -> void {
  auto channel = channel_.load(std::memory_order_acquire);
  if (!channel) {
    write_now(line);
    return;
  }
  Record record{.text = std::move(line), .reopen = {}};
  if (channel->try_send(boost::system::error_code{}, std::move(record))) {
    return;
  }
  // A rejected try_send leaves the record untouched.
  if (!attached_to_tty(output_.load(std::memory_order_acquire))) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  write_now(record.text);
}

auto Logger::writer_loop(std::shared_ptr<Channel> channel) -> void {
  std::vector<Record> batch;
  batch.reserve(kBatchSize);

  auto flush = [this](std::vector<Record> &records) {
    auto *out = output_.load(std::memory_order_acquire);
    for (auto &record : records) {
      if (record.reopen) {
        (void)reopen(*record.reopen);
        out = output_.load(std::memory_order_acquire);
        continue;
      }
      std::fwrite(record.text.data(), 1, record.text.size(), out);
    }
    std::fflush(out);
    records.clear();
  };

  auto drain = [&] {
    bool closed = false;
    while (!closed && batch.size() < kBatchSize &&
           channel->try_receive(
               [&](boost::system::error_code ec, Record record) {
                 if (ec) {
                   closed = true;
                   return;
                 }
                 batch.push_back(std::move(record));
               })) {
    }
  };

  // A receive abandoned by stop() may complete after this frame is gone, so
  // its handler only touches state it co-owns.
  struct Received {
    boost::system::error_code ec;
    std::optional<Record> record;
    bool done{false};
  };

  while (running_.load(std::memory_order_acquire)) {
    auto received = std::make_shared<Received>();
    channel->async_receive(
        [received](boost::system::error_code ec, Record record) {
          received->ec = ec;
          received->done = true;
          if (!ec) {
            received->record = std::move(record);
          }
        });
    channel_ctx_.restart();
    (void)channel_ctx_.run_one();
    if (!received->done) {
      // stop() interrupted run_one(); the close it issued first has already
      // queued the completion.
      channel_ctx_.restart();
      (void)channel_ctx_.poll();
    }
    if (received->record) {
      batch.push_back(std::move(*received->record));
    }
    if (!received->done || received->ec) {
      break;
    }
    drain();
    flush(batch);
  }

  // Lines accepted before close() still go out.
  for (;;) {
    drain();
    if (batch.empty()) {
      break;
    }
    flush(batch);
  }
}

} // namespace jobforge::log
