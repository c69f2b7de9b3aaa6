#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <rapidjson/document.h>

namespace theory_validator
{
  namespace pipeline
  {
    namespace json
    {
      using Allocator = rapidjson::Document::AllocatorType;

      inline rapidjson::Value str(const std::string& s, Allocator& alloc)
      {
	return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
      }

      // Non-finite values have no JSON form and are written as null.
      inline rapidjson::Value num(double v)
      {
	if (!std::isfinite(v))
	  return rapidjson::Value(rapidjson::kNullType);
	return rapidjson::Value(v);
      }

      inline rapidjson::Value num(const std::optional<double>& v)
      {
	return v ? num(*v) : rapidjson::Value(rapidjson::kNullType);
      }

      inline rapidjson::Value count(std::size_t n)
      {
	return rapidjson::Value(static_cast<uint64_t>(n));
      }

      inline rapidjson::Value integer(const std::optional<int>& v)
      {
	return v ? rapidjson::Value(*v) : rapidjson::Value(rapidjson::kNullType);
      }

      inline rapidjson::Value optString(const std::optional<std::string>& s, Allocator& alloc)
      {
	return s ? str(*s, alloc) : rapidjson::Value(rapidjson::kNullType);
      }

      inline rapidjson::Value date(const boost::gregorian::date& d, Allocator& alloc)
      {
	return str(boost::gregorian::to_iso_extended_string(d), alloc);
      }

      inline rapidjson::Value optDate(const std::optional<boost::gregorian::date>& d, Allocator& alloc)
      {
	return d ? date(*d, alloc) : rapidjson::Value(rapidjson::kNullType);
      }

      inline rapidjson::Value strings(const std::vector<std::string>& values, Allocator& alloc)
      {
	rapidjson::Value arr(rapidjson::kArrayType);
	for (const auto& v : values)
	  arr.PushBack(str(v, alloc), alloc);
	return arr;
      }

      // Adds key/value to an object; the key string is copied.
      inline void add(rapidjson::Value& obj, const char* key, rapidjson::Value value, Allocator& alloc)
      {
	rapidjson::Value name(key, alloc);
	obj.AddMember(name, value, alloc);
      }
    }
  }
}
