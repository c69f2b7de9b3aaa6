#include "RunStore.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include "SnapshotSerializer.h"
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace runstore
  {
    namespace fs = boost::filesystem;

    namespace
    {
      const char* kRunFileExtension = ".json";

      bool isRunId(const std::string& runId)
      {
	static const std::regex pattern("^(analyze|build|walkforward)-[0-9a-f]{16}$");
	return std::regex_match(runId, pattern);
      }

      void addString(rapidjson::Document& doc, const char* key, const std::string& value)
      {
	auto& allocator = doc.GetAllocator();
	doc.AddMember(rapidjson::StringRef(key), rapidjson::Value(value.c_str(), allocator), allocator);
      }

      void addEmbedded(rapidjson::Document& doc, const char* key, const std::string& json)
      {
	rapidjson::Document embedded;
	embedded.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
	if (embedded.HasParseError())
	  throw RunStoreException(std::string("Run payload '") + key + "' is not valid JSON: " +
				  rapidjson::GetParseError_En(embedded.GetParseError()));

	auto& allocator = doc.GetAllocator();
	rapidjson::Value copy(embedded, allocator);
	doc.AddMember(rapidjson::StringRef(key), copy, allocator);
      }

      const rapidjson::Value& member(const rapidjson::Document& doc, const char* key, const std::string& source)
      {
	auto it = doc.FindMember(key);
	if (it == doc.MemberEnd())
	  throw RunStoreException("Stored run " + source + " has no '" + key + "' field");
	return it->value;
      }

      std::string stringMember(const rapidjson::Document& doc, const char* key, const std::string& source)
      {
	const auto& value = member(doc, key, source);
	if (!value.IsString())
	  throw RunStoreException("Stored run " + source + " field '" + key + "' is not a string");
	return std::string(value.GetString(), value.GetStringLength());
      }
    }

    void sortForListing(std::vector<StoredRun>& runs)
    {
      std::sort(runs.begin(), runs.end(), [](const StoredRun& a, const StoredRun& b) {
	if (a.createdAt != b.createdAt)
	  return a.createdAt > b.createdAt;
	return a.id < b.id;
      });
    }

    bool InMemoryRunStore::save(const StoredRun& run)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return mRuns.emplace(run.id, run).second;
    }

    StoredRun InMemoryRunStore::get(const std::string& runId) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      auto it = mRuns.find(runId);
      if (it == mRuns.end())
	throw RunNotFoundException(runId);
      return it->second;
    }

    std::vector<StoredRun> InMemoryRunStore::list() const
    {
      std::vector<StoredRun> runs;
      {
	std::lock_guard<std::mutex> lock(mMutex);
	for (const auto& kv : mRuns)
	  runs.push_back(kv.second);
      }
      sortForListing(runs);
      return runs;
    }

    FileRunStore::FileRunStore(const fs::path& directory)
      : mDirectory(directory)
    {
      boost::system::error_code ec;
      fs::create_directories(mDirectory, ec);
      if (ec)
	throw RunStoreException("Cannot create run directory " + mDirectory.string() + ": " + ec.message());
    }

    fs::path FileRunStore::runPath(const std::string& runId) const
    {
      if (!isRunId(runId))
	throw RunStoreException("Malformed run id '" + runId + "'");
      return mDirectory / (runId + kRunFileExtension);
    }

    bool FileRunStore::save(const StoredRun& run)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const fs::path target = runPath(run.id);
      if (fs::exists(target))
	return false;

      const std::string text = encode(run);
      const fs::path temp = mDirectory / fs::unique_path(run.id + ".%%%%-%%%%.tmp");
      {
	std::ofstream out(temp.string(), std::ios::binary | std::ios::trunc);
	if (!out)
	  throw RunStoreException("Cannot open " + temp.string() + " for writing");
	out << text;
	out.flush();
	if (!out)
	  throw RunStoreException("Failed writing " + temp.string());
      }

      boost::system::error_code ec;
      fs::rename(temp, target, ec);
      if (ec)
	{
	  boost::system::error_code ignored;
	  fs::remove(temp, ignored);
	  throw RunStoreException("Cannot move run into place at " + target.string() + ": " + ec.message());
	}
      return true;
    }

    StoredRun FileRunStore::get(const std::string& runId) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const fs::path path = runPath(runId);
      if (!fs::exists(path))
	throw RunNotFoundException(runId);

      std::ifstream in(path.string(), std::ios::binary);
      if (!in)
	throw RunStoreException("Cannot open " + path.string());
      const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      return decode(text, path.string());
    }

    std::vector<StoredRun> FileRunStore::list() const
    {
      std::vector<std::string> ids;
      {
	std::lock_guard<std::mutex> lock(mMutex);
	for (fs::directory_iterator it(mDirectory), end; it != end; ++it)
	  {
	    const fs::path& p = it->path();
	    if (fs::is_regular_file(p) && p.extension() == kRunFileExtension && isRunId(p.stem().string()))
	      ids.push_back(p.stem().string());
	  }
      }

      std::vector<StoredRun> runs;
      runs.reserve(ids.size());
      for (const auto& id : ids)
	runs.push_back(get(id));
      sortForListing(runs);
      return runs;
    }

    std::string FileRunStore::encode(const StoredRun& run)
    {
      rapidjson::Document doc;
      doc.SetObject();
      addString(doc, "id", run.id);
      addString(doc, "created_at", run.createdAt);
      addString(doc, "run_type", run.runType);
      addString(doc, "target_name", run.targetName);
      addString(doc, "target_class", run.targetClass);
      doc.AddMember("cohort_size", static_cast<uint64_t>(run.cohortSize), doc.GetAllocator());
      addString(doc, "snapshot_hash", run.snapshotHash);
      addEmbedded(doc, "snapshot", run.snapshotJson);
      addEmbedded(doc, "result", run.resultJson);
      return SnapshotSerializer::toJson(doc);
    }

    StoredRun FileRunStore::decode(const std::string& json, const std::string& source)
    {
      rapidjson::Document doc;
      doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
      if (doc.HasParseError() || !doc.IsObject())
	throw RunStoreException("Stored run " + source + " is not a JSON object");

      StoredRun run;
      run.id = stringMember(doc, "id", source);
      run.createdAt = stringMember(doc, "created_at", source);
      run.runType = stringMember(doc, "run_type", source);
      run.targetName = stringMember(doc, "target_name", source);
      run.targetClass = stringMember(doc, "target_class", source);
      const auto& cohortSize = member(doc, "cohort_size", source);
      if (!cohortSize.IsUint64())
	throw RunStoreException("Stored run " + source + " field 'cohort_size' is not an integer");
      run.cohortSize = static_cast<std::size_t>(cohortSize.GetUint64());
      run.snapshotHash = stringMember(doc, "snapshot_hash", source);
      run.snapshotJson = SnapshotSerializer::toJson(member(doc, "snapshot", source));
      run.resultJson = SnapshotSerializer::toJson(member(doc, "result", source));
      return run;
    }
  }
}
