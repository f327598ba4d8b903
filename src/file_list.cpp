#include "file_list.hpp"
#include "piece_store.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace eddy {

std::vector<file_descriptor> make_file_descriptors(const std::vector<file_info>& files)
{
    std::vector<file_descriptor> descriptors;
    descriptors.reserve(files.size());
    int64_t offset = 0;
    for(const auto& info : files) {
        file_descriptor d;
        d.name = info.path.filename().string();
        d.path = info.path;
        d.length = info.length;
        d.offset = offset;
        offset += info.length;
        descriptors.emplace_back(std::move(d));
    }
    return descriptors;
}

file_list::file_list(std::shared_ptr<piece_store> store,
        std::vector<file_descriptor> files, const stream_settings& settings)
    : store_(std::move(store))
{
    files_.reserve(files.size());
    int64_t prev_end = 0;
    for(auto& descriptor : files) {
        if(descriptor.offset < prev_end) {
            throw std::invalid_argument(util::format("file '%s' at %lli overlaps the "
                    "previous file, which ends at %lli", descriptor.name.c_str(),
                    (long long)descriptor.offset, (long long)prev_end));
        }
        prev_end = descriptor.offset + descriptor.length;
        files_.emplace_back(std::make_shared<file>(store_, std::move(descriptor), settings));
    }
    log("created %i file(s)", size());
}

std::shared_ptr<file> file_list::find(const std::filesystem::path& path) const
{
    auto it = std::find_if(files_.begin(), files_.end(),
            [&path](const auto& f) { return f->path() == path; });
    if(it == files_.end()) {
        return nullptr;
    }
    return *it;
}

interval file_list::files_containing_piece(const piece_index_t piece) const noexcept
{
    if(store_ == nullptr || piece < 0) {
        return {};
    }
    const int64_t piece_begin = int64_t(piece) * store_->piece_length();
    const int64_t piece_end = piece_begin + store_->piece_length();

    // Files are ordered by offset and don't overlap, so their end offsets are sorted
    // too: the first file that may touch the piece is the first ending past its start.
    auto first = std::lower_bound(files_.begin(), files_.end(), piece_begin,
            [](const auto& f, const int64_t offset) {
                return f->offset() + f->length() <= offset;
            });
    auto last = first;
    while((last != files_.end()) && ((*last)->offset() < piece_end)) {
        ++last;
    }
    // empty files only count when they are between two files that have the piece
    while((first != last) && ((*first)->length() == 0)) {
        ++first;
    }
    while((last != first) && ((*(last - 1))->length() == 0)) {
        --last;
    }
    if(first == last) {
        return {};
    }
    return interval(first - files_.begin(), last - files_.begin());
}

void file_list::on_piece_verified(const piece_index_t piece)
{
    if(is_destroyed_) {
        return;
    }
    const auto files = files_containing_piece(piece);
    for(auto i = files.begin; i < files.end; ++i) {
        files_[i]->update_done();
    }
}

int64_t file_list::downloaded() const
{
    int64_t n = 0;
    for(const auto& f : files_) {
        n += f->downloaded();
    }
    return n;
}

bool file_list::is_done() const noexcept
{
    return std::all_of(files_.begin(), files_.end(),
            [](const auto& f) { return f->is_done(); });
}

void file_list::destroy()
{
    if(is_destroyed_) {
        return;
    }
    is_destroyed_ = true;
    for(auto& f : files_) {
        f->destroy();
    }
    store_.reset();
    log("destroyed %i file(s)", size());
}

template <typename... Args>
void file_list::log(const char* format, Args&&... args) const
{
#ifdef EDDY_ENABLE_LOGGING
    log::log_store("FILES", util::format(format, std::forward<Args>(args)...));
#endif // EDDY_ENABLE_LOGGING
}

} // namespace eddy
