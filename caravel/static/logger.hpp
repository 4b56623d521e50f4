// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_STATIC_LOGGER_
#define CARAVEL_STATIC_LOGGER_

#include "../fwd.hpp"
namespace caravel {

// The process-wide logger. Any thread may enqueue messages; they are written
// by a dedicated thread which calls `thread_loop()` repeatedly. Levels are
// numbered from 0 (fatal) to 5 (trace).
class Logger
  {
  public:
    struct Level_Config;
    struct Message;

  private:
    mutable plain_mutex m_conf_mutex;
    cow_vector<Level_Config> m_levels;
    atomic_relaxed<uint32_t> m_enabled_bits;

    mutable plain_mutex m_queue_mutex;
    condition_variable m_queue_avail;
    cow_vector<Message> m_queue;

    // This is locked before `m_queue_mutex` is released, so batches are
    // written in the order they were taken.
    mutable plain_mutex m_write_mutex;

  public:
    // Creates a logger with all levels disabled.
    Logger() noexcept;

  public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) & = delete;
    ~Logger();

    // Reloads level settings from the `logger` section of `conf_file`. In
    // verbose mode every level is also written to standard output. If an
    // exception is thrown, there is no effect.
    void
    reload(const Config_File& conf_file, bool verbose);

    // Waits for messages and writes them out.
    void
    thread_loop();

    ROCKET_PURE
    bool
    enabled(uint8_t level)
      const noexcept
      { return (level < 32U) && ((this->m_enabled_bits.load() >> level) & 1U);  }

    // Enqueues a message for the logger thread.
    void
    enqueue(uint8_t level, const char* func, const char* file, uint32_t line,
            const cow_string& text);

    // Writes all pending messages in the calling thread.
    void
    synchronize()
      noexcept;
  };

}  // namespace caravel
#endif
