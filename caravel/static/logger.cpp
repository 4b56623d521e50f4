// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "logger.hpp"
#include "../base/config_file.hpp"
#include "../utils.hpp"
#include <unordered_map>
#include <time.h>
#include <pthread.h>
#include <sys/syscall.h>
namespace caravel {

struct Logger::Level_Config
  {
    cow_string name;
    cow_string color;
    bool expendable = false;
    cow_vector<phcow_string> files;
  };

struct Logger::Message
  {
    uint8_t level;
    uint32_t thread_id;
    char thread_name[16];
    const char* func;
    const char* file;
    uint32_t line;
    cow_string text;
  };

namespace {

constexpr char s_level_names[][8] = { "fatal", "error", "warn", "info", "debug", "trace" };

// Messages of expendable levels are dropped when this many are pending.
constexpr size_t s_expendable_threshold = 1000;

using File_Table = ::std::unordered_map<phcow_string, unique_posix_fd, phcow_string::hash>;

void
do_set_rendition(linear_buffer& line, const Logger::Level_Config& lconf, const char* sgr)
  {
    if(lconf.color.empty())
      return;

    line.puts("\x1B[");
    line.puts(sgr);
    line.putc('m');
  }

void
do_put_number(linear_buffer& line, uint64_t value, size_t width = 1)
  {
    ::rocket::ascii_numput nump;
    nump.put_DU(value, width);
    line.putn(nump.data(), nump.size());
  }

void
do_put_timestamp(linear_buffer& line)
  {
    ::timespec ts;
    ::clock_gettime(CLOCK_REALTIME, &ts);
    ::tm tm;
    ::localtime_r(&(ts.tv_sec), &tm);

    char temp[32];
    size_t len = ::strftime(temp, sizeof(temp), "%Y-%m-%d %H:%M:%S.", &tm);
    line.putn(temp, len);
    do_put_number(line, static_cast<uint64_t>(ts.tv_nsec / 1000), 6);
  }

void
do_put_escaped(linear_buffer& line, const Logger::Level_Config& lconf, const cow_string& text)
  {
    static constexpr char hex_digits[] = "0123456789ABCDEF";

    for(char ch : text) {
      uint8_t uch = static_cast<uint8_t>(ch);
      if(uch == '\n')
        line.puts("\n\t");
      else if((uch == '\t') || ((uch >= 0x20) && (uch != 0x7F)))
        line.putc(ch);
      else {
        // Control characters are shown as inverted hex escapes.
        do_set_rendition(line, lconf, "7");
        line.puts("\\x");
        line.putc(hex_digits[uch >> 4]);
        line.putc(hex_digits[uch & 15]);
        do_set_rendition(line, lconf, "27");
      }
    }
  }

int
do_open_log_file(const phcow_string& path)
  {
    if(path == "/dev/stdout")
      return ::dup(STDOUT_FILENO);

    if(path == "/dev/stderr")
      return ::dup(STDERR_FILENO);

    return ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  }

void
do_write_message(File_Table& files, const Logger::Level_Config& lconf, const Logger::Message& msg)
  noexcept
  try {
    // `2026-01-02 03:04:05.678901 [info] message text`
    linear_buffer line;
    do_set_rendition(line, lconf, lconf.color.c_str());
    do_put_timestamp(line);
    line.puts(" [");
    line.putn(lconf.name.data(), lconf.name.size());
    line.puts("] ");
    do_put_escaped(line, lconf, msg.text);
    do_set_rendition(line, lconf, "0");

    // `    @@ thread 1234 [name] in `func` at 'file:line'`
    do_set_rendition(line, lconf, "90");
    line.puts("\n\t@@ thread ");
    do_put_number(line, msg.thread_id);
    line.puts(" [");
    line.putn(msg.thread_name, ::strnlen(msg.thread_name, sizeof(msg.thread_name)));
    line.puts("] in `");
    line.puts(msg.func);
    line.puts("` at '");
    line.puts(msg.file);
    line.putc(':');
    do_put_number(line, msg.line);
    line.putc('\'');
    do_set_rendition(line, lconf, "0");
    line.putc('\n');

    for(const auto& path : lconf.files) {
      auto r = files.emplace(path, unique_posix_fd());
      if(r.second)
        r.first->second.reset(do_open_log_file(path));

      // Write errors cannot be reported anywhere.
      if(r.first->second)
        (void)! ::write(r.first->second, line.data(), line.size());
    }
  }
  catch(exception& stdex) {
    ::fprintf(stderr, "WARNING: Could not write log message: %s\n", stdex.what());
  }

void
do_write_batch(const cow_vector<Logger::Level_Config>& levels,
               const cow_vector<Logger::Message>& batch, bool drop_expendable)
  noexcept
  {
    File_Table files;
    for(const auto& msg : batch) {
      if(msg.level >= levels.size())
        continue;

      const auto& lconf = levels[msg.level];
      if(drop_expendable && lconf.expendable)
        continue;

      do_write_message(files, lconf, msg);
    }
  }

}  // namespace

Logger::
Logger() noexcept
  {
  }

Logger::
~Logger()
  {
  }

void
Logger::
reload(const Config_File& conf_file, bool verbose)
  {
    cow_vector<Level_Config> levels;
    uint32_t enabled_bits = 0;

    for(const char* name : s_level_names) {
      auto& lconf = levels.emplace_back();
      lconf.name.assign(name);
      lconf.color = conf_file.get_string_opt(sformat("logger.$1.color", name)).value_or(&"");
      lconf.expendable = conf_file.get_boolean_opt(sformat("logger.$1.expendable", name)).value_or(false);

      size_t nfiles = conf_file.get_array_size_opt(sformat("logger.$1.files", name)).value_or(0);
      bool to_stdout = false;
      for(size_t k = 0;  k != nfiles;  ++k) {
        auto path = conf_file.get_string(sformat("logger.$1.files[$2]", name, k));
        if(path.empty())
          continue;

        to_stdout |= (path == "/dev/stdout");
        lconf.files.emplace_back(path);
      }

      if(verbose && !to_stdout)
        lconf.files.emplace_back(&"/dev/stdout");

      if(!lconf.files.empty())
        enabled_bits |= 1U << (levels.size() - 1);
    }

    if(enabled_bits == 0)
      ::fputs("WARNING: All log levels are disabled.\n", stderr);

    plain_mutex::unique_lock lock(this->m_conf_mutex);
    this->m_levels.swap(levels);
    this->m_enabled_bits.store(enabled_bits);
  }

void
Logger::
thread_loop()
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    while(this->m_queue.empty())
      this->m_queue_avail.wait(lock);

    cow_vector<Message> batch;
    batch.swap(this->m_queue);
    plain_mutex::unique_lock write_lock(this->m_write_mutex);
    lock.unlock();

    lock.lock(this->m_conf_mutex);
    const auto levels = this->m_levels;
    lock.unlock();

    do_write_batch(levels, batch, batch.size() > s_expendable_threshold);
  }

void
Logger::
enqueue(uint8_t level, const char* func, const char* file, uint32_t line, const cow_string& text)
  {
    Message msg;
    msg.level = level;
    msg.thread_id = static_cast<uint32_t>(::syscall(SYS_gettid));
    if(::pthread_getname_np(::pthread_self(), msg.thread_name, sizeof(msg.thread_name)) != 0)
      ::strcpy(msg.thread_name, "unknown");

    msg.func = func;
    msg.file = file;
    msg.line = line;
    msg.text = text;

    plain_mutex::unique_lock lock(this->m_queue_mutex);
    this->m_queue.emplace_back(move(msg));
    this->m_queue_avail.notify_one();
  }

void
Logger::
synchronize()
  noexcept
  {
    plain_mutex::unique_lock lock(this->m_queue_mutex);
    if(this->m_queue.empty())
      return;

    cow_vector<Message> batch;
    batch.swap(this->m_queue);
    plain_mutex::unique_lock write_lock(this->m_write_mutex);
    lock.unlock();

    lock.lock(this->m_conf_mutex);
    const auto levels = this->m_levels;
    lock.unlock();

    do_write_batch(levels, batch, false);
  }

}  // namespace caravel
