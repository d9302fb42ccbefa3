#include "mcumgr/file_download.hpp"

#include "commands.hpp"

namespace mcumgr {

FileDownloader::FileDownloader(Client& client, DownloadObserver& observer,
                               const TransferConfig& cfg)
    : TransferController(client, observer, cfg), observer_(observer) {}

FileDownloader::~FileDownloader() {
    shutdown();
}

Error FileDownloader::start(const std::string& path) {
    TransferSession s;
    s.resource = path;
    return start_session(std::move(s));
}

Error FileDownloader::build_chunk(const TransferSession& s, Op& op, uint16_t& group,
                                  uint8_t& id, Document& body) {
    op    = Op::Read;
    group = GROUP_FS;
    id    = FS_FILE;
    body  = make_fs_download(s.resource, s.offset);
    return Error();
}

// ---- apply_chunk() ----
// Validate everything first; the session is only touched once the reply
// is known to be good.
Error FileDownloader::apply_chunk(const Response& rsp, TransferSession& s) {
    const Document& b = rsp.body();
    if (!payload::has(b, "off") || !payload::has(b, "data"))
        return Error(ErrorCode::PayloadDecodeError);

    int64_t off = -1;
    Error e = payload::get_int(b, "off", off);
    if (!e.ok()) return e;
    if (off != static_cast<int64_t>(s.offset)) return Error(ErrorCode::SequenceMismatch);

    Bytes chunk;
    e = payload::get_bytes(b, "data", chunk);
    if (!e.ok()) return e;

    bool total_known = s.total_known;
    uint32_t total = s.total;
    if (!total_known) {
        int64_t len = -1;
        if (!payload::has(b, "len")) return Error(ErrorCode::PayloadDecodeError);
        e = payload::get_int(b, "len", len);
        if (!e.ok()) return e;
        if (len < 0 || len > 0xFFFFFFFFLL) return Error(ErrorCode::PayloadDecodeError);
        total = static_cast<uint32_t>(len);
        total_known = true;
    }

    if (chunk.empty() && s.offset < total)            return Error(ErrorCode::PayloadDecodeError);
    if (chunk.size() > static_cast<std::size_t>(total - s.offset))
        return Error(ErrorCode::PayloadDecodeError);

    if (!s.total_known) {
        s.total = total;
        s.total_known = true;
        s.data.reserve(total);
    }
    s.data.insert(s.data.end(), chunk.begin(), chunk.end());
    s.offset += static_cast<uint32_t>(chunk.size());
    return Error();
}

void FileDownloader::notify_completed(Bytes&& data) {
    observer_.on_download_completed(data);
}

} // namespace mcumgr
