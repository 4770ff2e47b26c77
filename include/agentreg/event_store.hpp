#pragma once

#include "events.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentreg
{

#ifdef AGENTREG_HAVE_ROCKSDB
    /**
     * RocksDB-backed event sink. Events are keyed by zero-padded sequence
     * number so iteration order is emission order.
     */
    class RocksDbEventSink : public EventSink
    {
    public:
        explicit RocksDbEventSink(const std::string &path);
        ~RocksDbEventSink() override;

        Result<void> append(const Event &event) override;

        /**
         * List stored events, optionally filtered by name.
         */
        Result<std::vector<Event>> list(const std::optional<std::string> &name) const;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
#endif

    /** True when the build links a persistent database sink. */
    bool have_rocksdb_sink();

    /**
     * Open the persistent sink at path. Fails with StorageError when the
     * database cannot be opened or the build has no database backend.
     */
    Result<std::shared_ptr<EventSink>> open_database_sink(const std::string &path);

} // namespace agentreg
