#include "sources/file_source.hpp"
#include "errors.hpp"
#include "snapshot.hpp"

PriceSeries FileSource::fetchSnapshot() {
    if (!open_) {
        throw PriceConnectionError("Session not initialized");
    }
    return loadSnapshotFile(path_);
}
