#include "mcumgr/upload.hpp"
#include "mcumgr/file_upload.hpp"
#include "mcumgr/image_upload.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include "commands.hpp"

namespace mcumgr {

// =============================================================================
// Uploader
// =============================================================================

Error Uploader::start_upload(std::string resource, Bytes data) {
    if (data.size() > std::numeric_limits<uint32_t>::max()) return Error(ErrorCode::MtuTooSmall);
    TransferSession s;
    s.resource    = std::move(resource);
    s.total       = static_cast<uint32_t>(data.size());
    s.total_known = true;
    s.data        = std::move(data);
    return start_session(std::move(s));
}

// ---- build_chunk() ----
// Budget is the link chunk size. The body with empty data costs `base`;
// each data byte costs one, plus whatever the byte-string head grows by.
Error Uploader::build_chunk(const TransferSession& s, Op& op, uint16_t& grp,
                            uint8_t& id, Document& body) {
    const std::size_t budget = s.chunk_size;
    const std::size_t base = payload::encode(make_body(s, nullptr, 0)).size();
    if (base >= budget) return Error(ErrorCode::MtuTooSmall);

    const std::size_t room = budget - base;
    const std::size_t remaining = s.data.size() - s.offset;
    std::size_t n = std::min(remaining, room);
    while (n > 0 && n + payload::bstr_head_size(n) - 1 > room) --n;
    if (n == 0 && remaining > 0) return Error(ErrorCode::MtuTooSmall);

    op   = Op::Write;
    grp  = group();
    id   = command();
    body = make_body(s, s.data.data() + s.offset, n);
    return Error();
}

// ---- apply_chunk() ----
// The device answers with the next offset it wants. Anything not ahead of
// what it already acknowledged is a reply to an older request.
Error Uploader::apply_chunk(const Response& rsp, TransferSession& s) {
    const Document& b = rsp.body();
    if (!payload::has(b, "off")) return Error(ErrorCode::PayloadDecodeError);

    int64_t off = -1;
    Error e = payload::get_int(b, "off", off);
    if (!e.ok()) return e;
    if (off < 0) return Error(ErrorCode::PayloadDecodeError);

    if (off < static_cast<int64_t>(s.offset)) return Error(ErrorCode::SequenceMismatch);
    if (off == static_cast<int64_t>(s.offset) && s.total != 0)
        return Error(ErrorCode::SequenceMismatch);
    if (off > static_cast<int64_t>(s.total)) return Error(ErrorCode::PayloadDecodeError);

    s.offset = static_cast<uint32_t>(off);
    return Error();
}

void Uploader::notify_completed(Bytes&&) {
    observer_.on_upload_completed();
}

// =============================================================================
// FileUploader
// =============================================================================

FileUploader::FileUploader(Client& client, UploadObserver& observer, const TransferConfig& cfg)
    : Uploader(client, observer, cfg) {}

FileUploader::~FileUploader() {
    shutdown();
}

Error FileUploader::start(const std::string& path, Bytes data) {
    return start_upload(path, std::move(data));
}

Document FileUploader::make_body(const TransferSession& s, const uint8_t* data, std::size_t n) const {
    return make_fs_upload(s.resource, s.offset, data, n, s.total);
}

uint16_t FileUploader::group() const { return GROUP_FS; }
uint8_t  FileUploader::command() const { return FS_FILE; }

// =============================================================================
// ImageUploader
// =============================================================================

ImageUploader::ImageUploader(Client& client, UploadObserver& observer, const TransferConfig& cfg)
    : Uploader(client, observer, cfg) {}

ImageUploader::~ImageUploader() {
    shutdown();
}

// The slot travels in the session as its decimal text.
Error ImageUploader::start(uint8_t image, Bytes data) {
    return start_upload(std::to_string(image), std::move(data));
}

Document ImageUploader::make_body(const TransferSession& s, const uint8_t* data, std::size_t n) const {
    const uint8_t image = static_cast<uint8_t>(std::strtoul(s.resource.c_str(), nullptr, 10));
    return make_image_upload(image, s.offset, data, n, s.total);
}

uint16_t ImageUploader::group() const { return GROUP_IMAGE; }
uint8_t  ImageUploader::command() const { return IMAGE_UPLOAD; }

} // namespace mcumgr
