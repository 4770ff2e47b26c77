#include "agentreg/event_store.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

#ifdef AGENTREG_HAVE_ROCKSDB
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#endif

namespace agentreg
{

#ifdef AGENTREG_HAVE_ROCKSDB
    namespace
    {
        std::string sequence_key(uint64_t sequence)
        {
            std::string digits = std::to_string(sequence);
            return std::string(20 - digits.size(), '0') + digits;
        }
    } // namespace

    class RocksDbEventSink::Impl
    {
    public:
        explicit Impl(const std::string &path)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, path, &db);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
        }

        ~Impl()
        {
            delete db;
        }

        Result<void> put(const Event &event)
        {
            auto status = db->Put(rocksdb::WriteOptions(), sequence_key(event.sequence), event.to_json().dump());
            if (!status.ok())
            {
                return std::unexpected(RegistryError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

        Result<std::vector<Event>> list(const std::optional<std::string> &name) const
        {
            std::vector<Event> out;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->SeekToFirst(); it->Valid(); it->Next())
            {
                auto parsed = nlohmann::json::parse(it->value().ToString(), nullptr, false);
                if (parsed.is_discarded())
                {
                    return std::unexpected(RegistryError::storage("Corrupt event at key " + it->key().ToString()));
                }
                auto event = Event::from_json(parsed);
                if (!event)
                    return std::unexpected(event.error());
                if (name && event->name != *name)
                    continue;
                out.push_back(std::move(*event));
            }
            if (!it->status().ok())
            {
                return std::unexpected(RegistryError::storage("RocksDB iteration failed: " + it->status().ToString()));
            }
            return out;
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    RocksDbEventSink::RocksDbEventSink(const std::string &path) : impl_(std::make_unique<Impl>(path)) {}
    RocksDbEventSink::~RocksDbEventSink() = default;

    Result<void> RocksDbEventSink::append(const Event &event)
    {
        return impl_->put(event);
    }

    Result<std::vector<Event>> RocksDbEventSink::list(const std::optional<std::string> &name) const
    {
        return impl_->list(name);
    }
#endif // AGENTREG_HAVE_ROCKSDB

    bool have_rocksdb_sink()
    {
#ifdef AGENTREG_HAVE_ROCKSDB
        return true;
#else
        return false;
#endif
    }

    Result<std::shared_ptr<EventSink>> open_database_sink(const std::string &path)
    {
#ifdef AGENTREG_HAVE_ROCKSDB
        try
        {
            return std::shared_ptr<EventSink>(std::make_shared<RocksDbEventSink>(path));
        }
        catch (const std::runtime_error &e)
        {
            return std::unexpected(RegistryError::storage(e.what()));
        }
#else
        spdlog::warn("event database requested at {} but built without RocksDB", path);
        return std::unexpected(RegistryError::storage("Built without RocksDB; cannot open " + path));
#endif
    }

} // namespace agentreg
