// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_STATIC_MAIN_CONFIG_
#define CARAVEL_STATIC_MAIN_CONFIG_

#include "../fwd.hpp"
#include "../base/config_file.hpp"
namespace caravel {

class Main_Config
  {
  private:
    mutable plain_mutex m_mutex;
    Config_File m_file;

  public:
    // Constructs an empty configuration file.
    Main_Config() noexcept;

  public:
    Main_Config(const Main_Config&) = delete;
    Main_Config& operator=(const Main_Config&) & = delete;
    ~Main_Config();

    // Reloads 'main.conf' from the given path.
    // If this function fails, an exception is thrown, and there is no effect.
    // This function is thread-safe.
    void
    reload(const cow_string& conf_path);

    // Replaces the current file with `file`. This function is mostly useful
    // for testing.
    // This function is thread-safe.
    void
    replace(const Config_File& file) noexcept;

    // Copies the current file.
    // Configuration files are reference-counted and cheap to copy.
    // This function is thread-safe.
    Config_File
    copy() const noexcept;
  };

}  // namespace caravel
#endif
