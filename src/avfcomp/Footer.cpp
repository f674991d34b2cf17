#include "avfcomp/Footer.hpp"

#include <cstddef>
#include <utility>

namespace avfcomp {

namespace {

const std::string kRealTimeLabel = "RealTime: ";
const std::string kSkinLabel = "Skin: ";
const std::string kBannerHead = "Minesweeper Arbiter ";
const std::string kBannerTail = ". Copyright \xA9 2005-2006 Dmitriy I. Sukhomlynov";

std::vector<std::string> SplitFields(const std::vector<std::uint8_t>& raw, char sep)
{
  std::vector<std::string> fields(1);
  for (std::uint8_t b : raw) {
    if (static_cast<char>(b) == sep) {
      fields.emplace_back();
    } else {
      fields.back().push_back(static_cast<char>(b));
    }
  }
  return fields;
}

} // namespace

bool ParseAvfFooter(const std::vector<std::uint8_t>& raw, ReplayFooter& out, CodecError& outError)
{
  const std::vector<std::string> fields = SplitFields(raw, '\r');
  if (fields.size() < 4) {
    return Fail(outError, ErrorCode::MalformedFooter,
                "footer has " + std::to_string(fields.size()) + " fields, expected at least 4");
  }

  const std::string& skinField = fields[1];
  const std::size_t skinPos = skinField.find(kSkinLabel);
  if (skinPos == std::string::npos) {
    return Fail(outError, ErrorCode::MalformedFooter, "footer has no 'Skin: ' field");
  }

  const std::string& banner = fields[3];
  const std::size_t arbiter = banner.find("Arbiter");
  const std::size_t copyright = banner.find("Copyright");
  if (arbiter == std::string::npos || copyright == std::string::npos || copyright < 2 ||
      arbiter + 8 > copyright - 2) {
    return Fail(outError, ErrorCode::MalformedFooter, "footer banner is not an Arbiter copyright line");
  }

  out.skin = skinField.substr(skinPos + kSkinLabel.size());
  out.playerId = fields[2];
  out.arbiterVersion = banner.substr(arbiter + 8, (copyright - 2) - (arbiter + 8));
  return true;
}

bool ComputeRealTime(const ReplayRecord& record, std::string& out, CodecError& outError)
{
  if (record.events.empty()) {
    return Fail(outError, ErrorCode::MalformedFooter, "RealTime needs at least one event");
  }

  // Final '|'-separated field of the info block; its last 3 characters are the
  // fractional part of the time.
  std::size_t fieldStart = 0;
  for (std::size_t i = 0; i < record.tsInfo.size(); ++i) {
    if (record.tsInfo[i] == '|') fieldStart = i + 1;
  }
  const std::size_t fieldLen = record.tsInfo.size() - fieldStart;
  const std::size_t tailStart = fieldStart + (fieldLen > 3 ? fieldLen - 3 : 0);

  out = std::to_string(record.events.back().gametime / 1000u);
  out.append(record.tsInfo.begin() + static_cast<std::ptrdiff_t>(tailStart), record.tsInfo.end());
  return true;
}

bool AppendAvfFooter(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError)
{
  std::string realTime;
  if (!ComputeRealTime(record, realTime, outError)) return false;

  std::string text;
  text.reserve(128);
  text += kRealTimeLabel;
  text += realTime;
  text += '\r';
  text += kSkinLabel;
  text += record.footer.skin;
  text += '\r';
  text += record.footer.playerId;
  text += '\r';
  text += kBannerHead;
  text += record.footer.arbiterVersion;
  text += kBannerTail;

  out.insert(out.end(), text.begin(), text.end());
  return true;
}

void AppendCvfFooter(const ReplayFooter& footer, std::vector<std::uint8_t>& out)
{
  out.insert(out.end(), footer.skin.begin(), footer.skin.end());
  out.push_back('\r');
  out.insert(out.end(), footer.playerId.begin(), footer.playerId.end());
  out.push_back('\r');
  out.insert(out.end(), footer.arbiterVersion.begin(), footer.arbiterVersion.end());
}

bool ParseCvfFooter(const std::vector<std::uint8_t>& raw, ReplayFooter& out, CodecError& outError)
{
  std::vector<std::string> fields = SplitFields(raw, '\r');
  if (fields.size() != 3) {
    return Fail(outError, ErrorCode::MalformedFooter,
                "simplified footer has " + std::to_string(fields.size()) + " fields, expected 3");
  }
  out.skin = std::move(fields[0]);
  out.playerId = std::move(fields[1]);
  out.arbiterVersion = std::move(fields[2]);
  return true;
}

} // namespace avfcomp
