#include "SnapshotSerializer.h"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/uuid/detail/sha1.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace theory_validator
{
  namespace runstore
  {
    namespace
    {
      using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

      void writeCanonical(const rapidjson::Value& value, Writer& writer)
      {
	if (value.IsObject())
	  {
	    std::vector<rapidjson::Value::ConstMemberIterator> members;
	    for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it)
	      members.push_back(it);
	    std::sort(members.begin(), members.end(), [](const auto& a, const auto& b) {
	      const std::string lhs(a->name.GetString(), a->name.GetStringLength());
	      const std::string rhs(b->name.GetString(), b->name.GetStringLength());
	      return lhs < rhs;
	    });

	    writer.StartObject();
	    for (const auto& member : members)
	      {
		writer.Key(member->name.GetString(), member->name.GetStringLength());
		writeCanonical(member->value, writer);
	      }
	    writer.EndObject();
	  }
	else if (value.IsArray())
	  {
	    writer.StartArray();
	    for (const auto& element : value.GetArray())
	      writeCanonical(element, writer);
	    writer.EndArray();
	  }
	else
	  value.Accept(writer);
      }
    }

    std::string SnapshotSerializer::canonicalJson(const rapidjson::Value& value)
    {
      rapidjson::StringBuffer buffer;
      Writer writer(buffer);
      writeCanonical(value, writer);
      return std::string(buffer.GetString(), buffer.GetSize());
    }

    std::string SnapshotSerializer::toJson(const rapidjson::Value& value)
    {
      rapidjson::StringBuffer buffer;
      Writer writer(buffer);
      value.Accept(writer);
      return std::string(buffer.GetString(), buffer.GetSize());
    }

    std::string SnapshotSerializer::contentHash(const std::string& canonicalPayload)
    {
      boost::uuids::detail::sha1 hasher;
      hasher.process_bytes(canonicalPayload.data(), canonicalPayload.size());
      boost::uuids::detail::sha1::digest_type digest;
      hasher.get_digest(digest);

      std::ostringstream hex;
      hex << std::hex << std::setfill('0');
      for (const auto part : digest)
	hex << std::setw(2 * sizeof(part)) << static_cast<unsigned long>(part);
      return hex.str().substr(0, 16);
    }
  }
}
