#include "stream/file_streams.hpp"

#include "util/logger.hpp"

namespace blockflow {

FileStreams::FileStreams(const StreamConfig& cfg)
    : cfg_(cfg), executor_(cfg.io_threads), provider_(executor_, FileOptionsFrom(cfg)) {
    Logger::Instance().SetLevel(cfg_.log_level);
    LogDebug("file streams ready: save buffer %zu, read block %zu, settle %lld ms",
             cfg_.save_buffer_size,
             cfg_.read_block_size,
             static_cast<long long>(cfg_.settle_delay.count()));
}

std::unique_ptr<IByteSequence> FileStreams::Flow(const std::string& path) {
    return Reader(path).Flow();
}

CompletionSignal FileStreams::Save(const std::string& path, std::unique_ptr<IByteSequence> bytes) {
    return Writer(path).Save(std::move(bytes));
}

ByteFileReader FileStreams::Reader(std::string path) {
    return ByteFileReader(std::move(path), provider_);
}

ByteFileWriter FileStreams::Writer(std::string path) {
    return ByteFileWriter(std::move(path), provider_, cfg_);
}

} // namespace blockflow
