// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "main_config.hpp"
namespace caravel {

Main_Config::
Main_Config() noexcept
  {
  }

Main_Config::
~Main_Config()
  {
  }

void
Main_Config::
reload(const cow_string& conf_path)
  {
    // Read the file.
    Config_File file(conf_path);

    // Set up new data.
    plain_mutex::unique_lock lock(this->m_mutex);
    this->m_file.swap(file);
  }

void
Main_Config::
replace(const Config_File& file) noexcept
  {
    Config_File temp(file);
    plain_mutex::unique_lock lock(this->m_mutex);
    this->m_file.swap(temp);
  }

Config_File
Main_Config::
copy() const noexcept
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    return this->m_file;
  }

}  // namespace caravel
