#include "row_codec.h++"
#include <flatbuffers/flexbuffers.h>

using std::span, std::string, std::vector;

namespace Stowage {
  auto encode_row(const Row& row) -> vector<uint8_t> {
    flexbuffers::Builder fbb;
    fbb.Vector([&] {
      for (const auto& value : row) {
        std::visit(overload{
          [&](std::monostate) { fbb.Null(); },
          [&](int64_t i) { fbb.Int(i); },
          [&](double d) { fbb.Double(d); },
          [&](bool b) { fbb.Bool(b); },
          [&](const string& s) { fbb.String(s.data(), s.size()); }
        }, value);
      }
    });
    fbb.Finish();
    return fbb.GetBuffer();
  }

  auto decode_row(span<const uint8_t> data) -> Row {
    if (data.empty() || !flexbuffers::VerifyBuffer(data.data(), data.size())) {
      throw RowShapeError("Stored row is corrupt");
    }
    const auto root = flexbuffers::GetRoot(data.data(), data.size());
    if (!root.IsVector()) throw RowShapeError("Stored row is not a vector");
    const auto vec = root.AsVector();
    Row row;
    row.reserve(vec.size());
    for (size_t i = 0; i < vec.size(); i++) {
      const auto ref = vec[i];
      if (ref.IsNull()) row.emplace_back(std::monostate{});
      else if (ref.IsBool()) row.emplace_back(ref.AsBool());
      else if (ref.IsInt()) row.emplace_back(ref.AsInt64());
      else if (ref.IsFloat()) row.emplace_back(ref.AsDouble());
      else if (ref.IsString()) row.emplace_back(ref.AsString().str());
      else throw RowShapeError(fmt::format("Stored row has an unsupported value in column {:d}", i));
    }
    return row;
  }
}
