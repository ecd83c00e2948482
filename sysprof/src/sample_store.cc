#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include "include/sample_store.hh"

namespace SysProf {

namespace Detail {

static int syncFile(FILE *fp) {
#ifdef _WIN32
    return _commit(_fileno(fp));
#else
    return fsync(fileno(fp));
#endif
}

}  // namespace Detail

absl::Status writeSampleTimeSeries(const SampleTimeSeries &series, const fs::path &path) {
    ScopedFile fp(fopen(path.string().c_str(), "wb"));
    if (!fp) {
        return absl::UnavailableError(absl::StrFormat(
            "Cannot open sample dump %s: %s", path.string(), strerror(errno)));
    }

    std::string wire;
    if (!series.SerializeToString(&wire)) {
        return absl::InternalError(absl::StrFormat(
            "Failed to serialize %d samples for %s", series.samples_size(), path.string()));
    }

    // header is the size of the message in wire format
    size_t wire_size = wire.size();
    bool ok = fwrite(&wire_size, sizeof(wire_size), 1, fp.get()) == 1;
    ok = ok && fwrite(wire.data(), 1, wire.size(), fp.get()) == wire.size();
    ok = ok && fflush(fp.get()) == 0 && Detail::syncFile(fp.get()) == 0;
    if (!ok) {
        return absl::DataLossError(absl::StrFormat(
            "Failed writing sample dump %s: %s", path.string(), strerror(errno)));
    }

    LOG(INFO) << absl::StrFormat(
        "[SampleStore] %d samples written to %s (%lu bytes)", series.samples_size(),
        path.string(), sizeof(wire_size) + wire_size);
    return absl::OkStatus();
}

absl::StatusOr<SampleTimeSeries> readSampleTimeSeries(const fs::path &path) {
    ScopedFile fp(fopen(path.string().c_str(), "rb"));
    if (!fp) {
        return absl::NotFoundError(absl::StrFormat(
            "Cannot open sample dump %s: %s", path.string(), strerror(errno)));
    }

    SampleTimeSeries series;
    std::string wire;
    int frames = 0;
    while (true) {
        size_t wire_size;
        size_t header_read = fread(&wire_size, 1, sizeof(wire_size), fp.get());
        if (header_read == 0 && feof(fp.get())) break;
        if (header_read != sizeof(wire_size)) {
            return absl::DataLossError(absl::StrFormat(
                "Truncated frame header after %d frames in %s", frames, path.string()));
        }

        wire.resize(wire_size);
        if (fread(wire.data(), 1, wire_size, fp.get()) != wire_size) {
            return absl::DataLossError(absl::StrFormat(
                "Truncated frame %d in %s, expected %lu bytes", frames, path.string(),
                wire_size));
        }

        SampleTimeSeries frame;
        if (!frame.ParseFromString(wire)) {
            return absl::DataLossError(
                absl::StrFormat("Corrupt frame %d in %s", frames, path.string()));
        }
        series.MergeFrom(frame);
        frames++;
    }

    VLOG(1) << absl::StrFormat(
        "[SampleStore] Read %d samples in %d frames from %s", series.samples_size(), frames,
        path.string());
    return series;
}

}  // namespace SysProf
