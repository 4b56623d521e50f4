// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "config_file.hpp"
#include "../utils.hpp"
#include <asteria/utils.hpp>
#include <asteria/library/system.hpp>
namespace caravel {
namespace {

inline
bool
do_is_name_char(char c) noexcept
  {
    return ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
           || ((c >= '0') && (c <= '9'))
           || (c == '_') || (c == '-') || (c == '$') || (c == '@');
  }

inline
void
do_skip_blank(chars_view vpath, size_t& offset) noexcept
  {
    while((offset != vpath.n) && ((vpath.p[offset] == ' ') || (vpath.p[offset] == '\t')))
      offset ++;
  }

}  // namespace

Config_File::
Config_File() noexcept
  {
  }

Config_File::
Config_File(const cow_string& conf_path)
  {
    this->reload(conf_path);
  }

Config_File::
Config_File(const ::asteria::V_object& root) noexcept
  {
    this->m_root = root;
  }

Config_File::
~Config_File()
  {
  }

void
Config_File::
clear() noexcept
  {
    this->m_path.clear();
    this->m_root.clear();
  }

void
Config_File::
reload(const cow_string& conf_path)
  {
    auto real_path = ::asteria::get_real_path(conf_path);
    auto real_root = ::asteria::std_system_load_conf(real_path);

    // This will not throw exceptions.
    this->m_path.swap(real_path);
    this->m_root.swap(real_root);
  }

const ::asteria::Value&
Config_File::
query(chars_view vpath) const
  {
    // The path is a sequence of subscripts, where the first one must be a
    // name. Names are separated by dots; indices are enclosed in brackets.
    const ::asteria::Value* current = nullptr;
    size_t offset = 0;
    cow_string name;

    do_skip_blank(vpath, offset);
    if(offset == vpath.n)
      CARAVEL_THROW((
          "Invalid value path `$1`: empty path not allowed",
          "[in configuration file '$2']"),
          vpath, this->m_path);

    for(;;) {
      // Get a name.
      size_t name_start = offset;
      while((offset != vpath.n) && do_is_name_char(vpath.p[offset]))
        offset ++;

      if(offset == name_start)
        CARAVEL_THROW((
            "Invalid value path `$1` at offset `$2`: name expected",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      name.assign(vpath.p + name_start, offset - name_start);

      const ::asteria::V_object* parent = &(this->m_root);
      if(current && current->is_object())
        parent = &(current->as_object());
      else if(current)
        CARAVEL_THROW((
            "Invalid value path `$1` at offset `$2`: invalid subscript of non-object",
            "[in configuration file '$3']"),
            vpath, name_start, this->m_path);

      current = parent->ptr(name);
      if(!current)
        return ::asteria::null;

      // Get indices that follow the name, if any.
      do_skip_blank(vpath, offset);
      while((offset != vpath.n) && (vpath.p[offset] == '[')) {
        offset ++;
        do_skip_blank(vpath, offset);

        size_t index_start = offset;
        uint32_t index = 0;
        while((offset != vpath.n) && (vpath.p[offset] >= '0') && (vpath.p[offset] <= '9')) {
          if(index >= 999999)
            CARAVEL_THROW((
                "Invalid value path `$1` at offset `$2`: integer too large",
                "[in configuration file '$3']"),
                vpath, offset, this->m_path);

          index = index * 10 + static_cast<uint32_t>(vpath.p[offset] - '0');
          offset ++;
        }

        if(offset == index_start)
          CARAVEL_THROW((
              "Invalid value path `$1` at offset `$2`: digit expected",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        do_skip_blank(vpath, offset);
        if((offset == vpath.n) || (vpath.p[offset] != ']'))
          CARAVEL_THROW((
              "Invalid value path `$1` at offset `$2`: closed bracket expected",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        offset ++;
        do_skip_blank(vpath, offset);

        if(!current->is_array())
          CARAVEL_THROW((
              "Invalid value path `$1` at offset `$2`: invalid subscript of non-array",
              "[in configuration file '$3']"),
              vpath, index_start, this->m_path);

        current = current->as_array().ptr(index);
        if(!current)
          return ::asteria::null;
      }

      if(offset == vpath.n)
        return *current;

      if(vpath.p[offset] != '.')
        CARAVEL_THROW((
            "Invalid value path `$1` at offset `$2`: invalid character",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      offset ++;
      do_skip_blank(vpath, offset);
    }
  }

opt<bool>
Config_File::
get_boolean_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_boolean())
      CARAVEL_THROW((
          "Invalid `$1`: expecting a `boolean`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_boolean();
  }

opt<int64_t>
Config_File::
get_integer_opt(chars_view vpath, int64_t min, int64_t max) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_integer())
      CARAVEL_THROW((
          "Invalid `$1`: expecting an `integer`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    if((value.as_integer() < min) || (value.as_integer() > max))
      CARAVEL_THROW((
          "Invalid `$1`: value `$2` out of range [$4,$5]",
          "[in configuration file '$3']"),
          vpath, value, this->m_path, min, max);

    return value.as_integer();
  }

opt<double>
Config_File::
get_real_opt(chars_view vpath, double min, double max) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_real())
      CARAVEL_THROW((
          "Invalid `$1`: expecting an `integer` or `real`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    if(!((value.as_real() >= min) && (value.as_real() <= max)))
      CARAVEL_THROW((
          "Invalid `$1`: value `$2` out of range [$4,$5]",
          "[in configuration file '$3']"),
          vpath, value, this->m_path, min, max);

    return value.as_real();
  }

const cow_string&
Config_File::
get_string(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(!value.is_string())
      CARAVEL_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

opt<cow_string>
Config_File::
get_string_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_string())
      CARAVEL_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

opt<size_t>
Config_File::
get_array_size_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_array())
      CARAVEL_THROW((
          "Invalid `$1`: expecting an `array`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_array().size();
  }

}  // namespace caravel
