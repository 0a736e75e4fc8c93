#include "termbar/bar/proxy_reader.hpp"
#include "termbar/bar/bar.hpp"

namespace termbar {
namespace bar {

ProxyReader::ProxyReader(std::istream& stream, Bar& bar)
    : stream_(&stream), bar_(&bar) {}

std::streamsize ProxyReader::read(char* buffer, std::streamsize size) {
    stream_->read(buffer, size);
    std::streamsize n = stream_->gcount();
    bar_->increment(n);
    return n;
}

}
}
