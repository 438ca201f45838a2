#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "chunkcache/store/chunk-restorer.hh"
#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/store/memory-chunk-store.hh"
#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/serialise.hh"

namespace chunkcache {

/* Any byte string survives upload and restore unchanged, for any
   window size and codec. */
RC_GTEST_PROP(ChunkRoundTrip, restoresIdenticalBytes, (const std::string & data))
{
    auto chunkSize = *rc::gen::inRange<uint64_t>(1, 4096);
    auto compression = *rc::gen::element<std::string>("br", "none");

    auto store = make_ref<MemoryChunkStore>();
    AcceptAllValidator validator;

    ChunkWriterParams wp;
    wp.chunkSize = chunkSize;
    wp.compression = compression;
    wp.leaseHolder = "rapidcheck";
    ChunkWriter writer(store, validator, wp);
    StringSource source(data);
    auto written = writer.writeFrom("prop", source, data.size());

    RC_ASSERT(written.chunks == std::max<uint64_t>(1, (data.size() + chunkSize - 1) / chunkSize));

    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    ChunkRestorerParams rp;
    rp.bufferSize = 2 * chunkSize;
    ChunkRestorer restorer(store, validator, rp);
    auto res = restorer.restore("prop", tmpDir + "/out");

    RC_ASSERT(res.status == RestoreStatus::Restored);
    RC_ASSERT(res.peakQueued <= rp.bufferSize);
    RC_ASSERT(readFile(tmpDir + "/out") == data);
}

} // namespace chunkcache
