#pragma once

#include <streambuf>
#include <string>

namespace panel_promote::runner {

// Duplicates every character written to it into two stream buffers.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

bool message_indicates_disk_full(const std::string &message);

} // namespace panel_promote::runner
