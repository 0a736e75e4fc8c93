#pragma once

#include <istream>
#include <ios>

namespace termbar {
namespace bar {

class Bar;

// Reads from the wrapped stream and increments the bar by the number of
// bytes actually read.
class ProxyReader {
public:
    ProxyReader(std::istream& stream, Bar& bar);
    
    std::streamsize read(char* buffer, std::streamsize size);
    bool eof() const { return stream_->eof(); }
    bool good() const { return stream_->good(); }

private:
    std::istream* stream_;
    Bar* bar_;
};

}
}
