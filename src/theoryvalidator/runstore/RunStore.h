#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace theory_validator
{
  namespace runstore
  {
    /**
     * @brief A persisted run.
     *
     * createdAt is store metadata and never part of the result payload, so
     * replaying a run reproduces resultJson byte for byte.
     */
    struct StoredRun
    {
      std::string id;
      std::string createdAt;
      std::string runType;
      std::string targetName;
      std::string targetClass;
      std::size_t cohortSize{0};
      std::string snapshotHash;
      std::string snapshotJson;
      std::string resultJson;
    };

    // Newest first; equal timestamps fall back to id order.
    void sortForListing(std::vector<StoredRun>& runs);

    /**
     * @brief Write-once store of run snapshots keyed by run id.
     */
    class RunStore
    {
    public:
      virtual ~RunStore() = default;

      /**
       * @return false if a run with the same id already exists; the stored
       *         run is left untouched.
       */
      virtual bool save(const StoredRun& run) = 0;

      /**
       * @throws RunNotFoundException when no run has this id
       */
      virtual StoredRun get(const std::string& runId) const = 0;

      virtual std::vector<StoredRun> list() const = 0;
    };

    class InMemoryRunStore : public RunStore
    {
    public:
      bool save(const StoredRun& run) override;
      StoredRun get(const std::string& runId) const override;
      std::vector<StoredRun> list() const override;

    private:
      mutable std::mutex mMutex;
      std::map<std::string, StoredRun> mRuns;
    };

    /**
     * @brief One JSON file per run under a directory.
     *
     * A run is written to a temporary file in the same directory and renamed
     * into place, so readers never see a partially written run.
     */
    class FileRunStore : public RunStore
    {
    public:
      explicit FileRunStore(const boost::filesystem::path& directory);

      bool save(const StoredRun& run) override;
      StoredRun get(const std::string& runId) const override;
      std::vector<StoredRun> list() const override;

      const boost::filesystem::path& directory() const
      {
	return mDirectory;
      }

    private:
      boost::filesystem::path runPath(const std::string& runId) const;
      static std::string encode(const StoredRun& run);
      static StoredRun decode(const std::string& json, const std::string& source);

    private:
      boost::filesystem::path mDirectory;
      mutable std::mutex mMutex;
    };
  }
}
