/**
 * @file recording.cpp
 * @brief Loading activPAL raw data files.
 */

#include <palraw/recording.hpp>

#include <cmath>
#include <fstream>
#include <utility>

namespace palraw {

namespace {

Error read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error::NotFound;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return Error::IoError;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return Error::IoError;
    }

    return Error::Ok;
}

} // namespace

Error load_raw(const std::string& path, Metadata& meta, std::vector<RawSample>& samples) {
    Layout layout;
    auto status = layout_from_path(path, layout);
    if (status != Error::Ok) {
        return status;
    }

    std::vector<std::uint8_t> content;
    status = read_file(path, content);
    if (status != Error::Ok) {
        return status;
    }

    const std::size_t header_end = header_length(layout);
    if (content.size() < header_end) {
        return Error::HeaderTooShort;
    }

    Metadata m;
    status = extract_metadata(content.data(), header_end, m);
    if (status != Error::Ok) {
        return status;
    }

    status = decode_body(content.data() + header_end, content.size() - header_end, m.firmware,
                         layout, samples);
    if (status != Error::Ok) {
        return status;
    }

    meta = std::move(m);
    return Error::Ok;
}

void Recording::assign(Metadata meta, const std::vector<RawSample>& samples) {
    meta_ = std::move(meta);
    interval_ = palraw::sample_interval(meta_.hz);

    x_.clear();
    y_.clear();
    z_.clear();
    x_.reserve(samples.size());
    y_.reserve(samples.size());
    z_.reserve(samples.size());
    for (const auto& s : samples) {
        x_.push_back(raw_to_g(s.x));
        y_.push_back(raw_to_g(s.y));
        z_.push_back(raw_to_g(s.z));
    }

    rss_.reset();
    rss_computations_ = 0;
}

Error Recording::create(Metadata meta, const std::vector<RawSample>& samples, Recording& rec) {
    if (meta.hz <= 0) {
        return Error::InvalidSampleRate;
    }
    rec.assign(std::move(meta), samples);
    return Error::Ok;
}

Error Recording::load(const std::string& path, Recording& rec) {
    Metadata meta;
    std::vector<RawSample> samples;
    auto status = load_raw(path, meta, samples);
    if (status != Error::Ok) {
        return status;
    }
    return create(std::move(meta), samples, rec);
}

#if !PALRAW_NO_EXCEPTIONS

Recording Recording::load(const std::string& path) {
    Metadata meta;
    std::vector<RawSample> samples;
    auto status = load_raw(path, meta, samples);
    if (status != Error::Ok) {
        throw_error(status, path);
    }
    return Recording(std::move(meta), samples);
}

Recording::Recording(Metadata meta, const std::vector<RawSample>& samples) {
    if (meta.hz <= 0) {
        throw InvalidDataException("Sample rate of zero in header", Error::InvalidSampleRate);
    }
    assign(std::move(meta), samples);
}

#endif // !PALRAW_NO_EXCEPTIONS

std::vector<double> Recording::rss() const {
    if (!rss_) {
        std::vector<double> magnitude(x_.size());
        for (std::size_t i = 0; i < x_.size(); ++i) {
            magnitude[i] = std::sqrt(x_[i] * x_[i] + y_[i] * y_[i] + z_[i] * z_[i]);
        }
        rss_ = std::move(magnitude);
        ++rss_computations_;
    }
    return *rss_;
}

std::vector<Timestamp> Recording::timestamps() const {
    std::vector<Timestamp> result;
    result.reserve(x_.size());
    for (std::size_t i = 0; i < x_.size(); ++i) {
        result.push_back(timestamp(i));
    }
    return result;
}

} // namespace palraw
