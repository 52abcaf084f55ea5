/**
 * @file PdfDisarmer.cpp
 * @brief Implementation of PdfDisarmer.
 */

#include "infrastructure/PdfDisarmer.hpp"
#include "infrastructure/ExternalTool.hpp"
#include "infrastructure/ScopedWorkArea.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace filegate::infrastructure {

using domain::DisarmResult;
using domain::NeutralizationAction;

namespace {

const std::map<std::string, NeutralizationAction>& ActiveNames() {
    static const std::map<std::string, NeutralizationAction> names = {
        {"JavaScript", NeutralizationAction::RemovedJavaScript},
        {"JS", NeutralizationAction::RemovedJavaScript},
        {"OpenAction", NeutralizationAction::RemovedAutomaticAction},
        {"AA", NeutralizationAction::RemovedAutomaticAction},
        {"Launch", NeutralizationAction::RemovedLaunchAction},
        {"EmbeddedFile", NeutralizationAction::RemovedEmbeddedFile},
        {"EmbeddedFiles", NeutralizationAction::RemovedEmbeddedFile},
        {"GoToE", NeutralizationAction::RemovedEmbeddedFile},
        {"RichMedia", NeutralizationAction::RemovedRichMedia},
        {"XFA", NeutralizationAction::RemovedXfaForm},
        {"SubmitForm", NeutralizationAction::RemovedFormSubmission},
        {"ImportData", NeutralizationAction::RemovedFormSubmission},
    };
    return names;
}

bool IsWhite(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\0';
}

bool IsDelimiter(char c) {
    switch (c) {
        case '(': case ')': case '<': case '>': case '[': case ']':
        case '{': case '}': case '/': case '%':
            return true;
        default:
            return false;
    }
}

bool IsRegular(char c) { return !IsWhite(c) && !IsDelimiter(c); }

bool KeywordAt(const std::string& d, std::size_t i, const char* keyword) {
    std::size_t len = std::strlen(keyword);
    if (d.compare(i, len, keyword) != 0) return false;
    if (i > 0 && IsRegular(d[i - 1])) return false;
    if (i + len < d.size() && IsRegular(d[i + len])) return false;
    return true;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Resolves #xx escapes: /J#61vaScript names the same key as /JavaScript.
std::string DecodeName(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '#' && i + 2 < raw.size()) {
            int hi = HexValue(raw[i + 1]);
            int lo = HexValue(raw[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += raw[i];
    }
    return out;
}

std::optional<std::string> Inflate(const std::string& in, std::uint64_t maxOut) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit(&zs) != Z_OK) return std::nullopt;

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    std::string out;
    char buffer[16384];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }
        out.append(buffer, sizeof(buffer) - zs.avail_out);
        if (out.size() > maxOut) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

struct WalkState {
    std::map<std::string, int> found;
    int hidden = 0;
    bool encrypted = false;
    std::string problem;
    std::set<std::size_t> objectHeaders;
};

// Splits a dictionary into tokens. Names come back decoded with their
// leading slash, strings collapse to "()" and hex strings to "<>".
std::vector<std::string> DictionaryTokens(const std::string& s) {
    std::vector<std::string> tokens;
    const std::size_t n = s.size();
    std::size_t i = 0;
    while (i < n) {
        char c = s[i];
        if (IsWhite(c)) { ++i; continue; }
        if (c == '%') {
            while (i < n && s[i] != '\n' && s[i] != '\r') ++i;
            continue;
        }
        if (c == '(') {
            int depth = 1;
            ++i;
            while (i < n && depth > 0) {
                if (s[i] == '\\') { i += 2; continue; }
                if (s[i] == '(') ++depth;
                else if (s[i] == ')') --depth;
                ++i;
            }
            tokens.push_back("()");
            continue;
        }
        if (c == '<' || c == '>') {
            if (i + 1 < n && s[i + 1] == c) {
                tokens.push_back(std::string(2, c));
                i += 2;
            } else if (c == '<') {
                std::size_t close = s.find('>', i + 1);
                i = close == std::string::npos ? n : close + 1;
                tokens.push_back("<>");
            } else {
                tokens.push_back(">");
                ++i;
            }
            continue;
        }
        if (c == '/') {
            std::size_t j = i + 1;
            while (j < n && IsRegular(s[j])) ++j;
            tokens.push_back("/" + DecodeName(s.substr(i + 1, j - i - 1)));
            i = j;
            continue;
        }
        if (IsDelimiter(c)) {
            tokens.push_back(std::string(1, c));
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < n && IsRegular(s[j])) ++j;
        tokens.push_back(s.substr(i, j - i));
        i = j;
    }
    return tokens;
}

bool IsInteger(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(),
                                         [](unsigned char ch){ return std::isdigit(ch) != 0; });
}

struct StreamDictionary {
    bool objectStream = false;
    bool decodeParms = false;
    std::vector<std::string> filters;
    std::optional<std::size_t> length;   ///< Only when given directly, not as a reference.
};

// Reads the top-level keys of the dictionary preceding a stream keyword.
StreamDictionary ParseStreamDictionary(const std::string& text) {
    StreamDictionary dict;
    auto tokens = DictionaryTokens(text);
    int depth = 0;
    for (std::size_t k = 0; k < tokens.size(); ++k) {
        const std::string& t = tokens[k];
        if (t == "<<") { ++depth; continue; }
        if (t == ">>") { --depth; continue; }
        if (depth != 1 || k + 1 >= tokens.size()) continue;

        const std::string& next = tokens[k + 1];
        if (t == "/Type") {
            dict.objectStream = dict.objectStream || next == "/ObjStm";
        } else if (t == "/Filter") {
            if (next == "[") {
                for (std::size_t f = k + 2; f < tokens.size() && tokens[f] != "]"; ++f) {
                    dict.filters.push_back(tokens[f]);
                }
            } else {
                dict.filters.push_back(next);
            }
        } else if (t == "/DecodeParms") {
            dict.decodeParms = next != "null";
        } else if (t == "/Length" && IsInteger(next)) {
            bool reference = k + 3 < tokens.size() && IsInteger(tokens[k + 2]) && tokens[k + 3] == "R";
            if (!reference) {
                try {
                    dict.length = static_cast<std::size_t>(std::stoull(next));
                } catch (const std::exception&) {
                    dict.length.reset();
                }
            }
        }
    }
    return dict;
}

// True when "obj" at @p i is preceded by an "N G" object number pair.
bool ObjectHeaderAt(const std::string& d, std::size_t i) {
    std::size_t k = i;
    while (k > 0 && IsWhite(d[k - 1])) --k;
    std::size_t digitsEnd = k;
    while (k > 0 && std::isdigit(static_cast<unsigned char>(d[k - 1]))) --k;
    if (k == digitsEnd) return false;
    std::size_t whiteEnd = k;
    while (k > 0 && IsWhite(d[k - 1])) --k;
    if (k == whiteEnd) return false;
    digitsEnd = k;
    while (k > 0 && std::isdigit(static_cast<unsigned char>(d[k - 1]))) --k;
    return k != digitsEnd;
}

// Readers reach objects through xref offsets, so an object header hidden in
// a string, comment or stream body is as live as one the walk entered.
std::optional<std::size_t> StrayObjectHeader(const std::string& d, const std::set<std::size_t>& accepted) {
    for (std::size_t pos = d.find("obj"); pos != std::string::npos; pos = d.find("obj", pos + 1)) {
        if (pos >= 3 && d.compare(pos - 3, 3, "end") == 0) continue;
        if (pos + 3 < d.size() && IsRegular(d[pos + 3])) continue;
        if (ObjectHeaderAt(d, pos) && !accepted.count(pos)) return pos;
    }
    return std::nullopt;
}

bool TopLevelKeyword(const std::string& token) {
    return IsInteger(token) || token == "xref" || token == "trailer" || token == "startxref" ||
           token == "n" || token == "f";
}

// Walks PDF syntax, skipping comments, strings and stream bodies. Active
// names are counted, and neutralized in place when `rewrite` is set.
//
// A structured walk reads a whole file: between objects only the xref
// table, the trailer and comments may appear, and stream bodies and object
// streams are bounded by their dictionaries. The unstructured walk reads
// the decoded body of an object stream.
bool Walk(std::string& d, bool rewrite, bool structured, std::uint64_t maxInflate, WalkState& st) {
    const std::size_t n = d.size();
    std::size_t objStart = 0;
    bool inObject = false;
    int trailerDepth = 0;
    std::size_t i = 0;

    auto fail = [&st](const std::string& problem) {
        st.problem = problem;
        return false;
    };

    while (i < n) {
        const char c = d[i];
        const bool betweenObjects = structured && !inObject && trailerDepth == 0;

        if (IsWhite(c)) { ++i; continue; }

        if (c == '%') {
            while (i < n && d[i] != '\n' && d[i] != '\r') ++i;
            continue;
        }

        if (c == '(') {
            if (betweenObjects) return fail("Literal string outside any object");
            int depth = 1;
            ++i;
            while (i < n && depth > 0) {
                if (d[i] == '\\') { i += 2; continue; }
                if (d[i] == '(') ++depth;
                else if (d[i] == ')') --depth;
                ++i;
            }
            if (depth > 0) return fail("Unterminated literal string");
            continue;
        }

        if (c == '<') {
            if (i + 1 < n && d[i + 1] == '<') {
                if (structured && !inObject) ++trailerDepth;
                i += 2;
                continue;
            }
            if (betweenObjects) return fail("Hex string outside any object");
            std::size_t close = d.find('>', i + 1);
            if (close == std::string::npos) return fail("Unterminated hex string");
            i = close + 1;
            continue;
        }

        if (c == '>' && i + 1 < n && d[i + 1] == '>') {
            if (structured && !inObject) {
                if (trailerDepth == 0) return fail("Unbalanced dictionary outside any object");
                --trailerDepth;
            }
            i += 2;
            continue;
        }

        if (c == '/') {
            if (betweenObjects) return fail("Name outside any object");
            std::size_t j = i + 1;
            while (j < n && IsRegular(d[j])) ++j;
            std::string raw = d.substr(i + 1, j - i - 1);
            std::string name = DecodeName(raw);

            if (name == "Encrypt") st.encrypted = true;
            if (ActiveNames().count(name)) {
                st.found[name]++;
                if (rewrite) {
                    std::string neutral = name;
                    std::transform(neutral.begin(), neutral.end(), neutral.begin(),
                                   [](unsigned char ch){ return std::tolower(ch); });
                    neutral.append(raw.size() - neutral.size(), ' ');
                    d.replace(i + 1, raw.size(), neutral);
                }
            }
            i = j;
            continue;
        }

        if (IsDelimiter(c)) {
            if (betweenObjects) return fail(std::string("Unexpected '") + c + "' outside any object");
            ++i;
            continue;
        }

        std::size_t j = i;
        while (j < n && IsRegular(d[j])) ++j;
        const std::string token = d.substr(i, j - i);

        if (token == "obj") {
            if (structured) {
                if (inObject) return fail("Object header inside an object");
                if (trailerDepth > 0 || !ObjectHeaderAt(d, i)) return fail("Malformed object header");
                inObject = true;
                st.objectHeaders.insert(i);
            }
            objStart = i;
            i = j;
            continue;
        }

        if (token == "endobj") {
            if (structured) {
                if (!inObject) return fail("endobj without an object");
                inObject = false;
            }
            i = j;
            continue;
        }

        if (token == "stream") {
            if (!structured) return fail("Stream inside an object stream");
            if (!inObject) return fail("Stream outside any object");

            StreamDictionary dict = ParseStreamDictionary(d.substr(objStart, i - objStart));
            std::size_t body = j;
            if (body < n && d[body] == '\r') ++body;
            if (body < n && d[body] == '\n') ++body;

            std::size_t end = std::string::npos;
            std::size_t payloadEnd = std::string::npos;
            if (dict.length && *dict.length <= n - body) {
                std::size_t k = body + *dict.length;
                while (k < n && IsWhite(d[k])) ++k;
                if (KeywordAt(d, k, "endstream")) {
                    end = k;
                    payloadEnd = body + *dict.length;
                }
            }
            if (end == std::string::npos) {
                end = d.find("endstream", body);
                if (end == std::string::npos) return fail("Unterminated stream");
                payloadEnd = end;
            }

            if (dict.objectStream) {
                std::string payload = d.substr(body, payloadEnd - body);
                bool decodable = true;
                if (dict.filters.size() == 1 && dict.filters[0] == "/FlateDecode" && !dict.decodeParms) {
                    auto inflated = Inflate(payload, maxInflate);
                    if (!inflated) return fail("Cannot decode object stream");
                    payload = std::move(*inflated);
                } else if (!dict.filters.empty()) {
                    decodable = false;
                }

                if (decodable) {
                    WalkState inner;
                    if (!Walk(payload, false, false, maxInflate, inner)) {
                        return fail("Malformed object stream: " + inner.problem);
                    }
                    for (const auto& kv : inner.found) st.hidden += kv.second;
                } else {
                    // Opaque here; only normalization can show what it holds.
                    st.hidden++;
                }
            }
            i = end + 9;
            continue;
        }

        if (betweenObjects && !TopLevelKeyword(token)) {
            return fail("Unexpected '" + token.substr(0, 32) + "' outside any object");
        }
        i = j;
    }

    if (!structured) return true;
    if (inObject) return fail("Unterminated object");
    if (trailerDepth != 0) return fail("Unterminated trailer dictionary");
    if (auto stray = StrayObjectHeader(d, st.objectHeaders)) {
        return fail("Object header at offset " + std::to_string(*stray) + " outside the object structure");
    }
    return true;
}

bool ReadAll(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace

int PdfDisarmer::Inspection::scriptObjectCount() const {
    int count = 0;
    for (const char* key : {"JavaScript", "JS"}) {
        auto it = activeNames.find(key);
        if (it != activeNames.end()) count += it->second;
    }
    return count;
}

PdfDisarmer::Inspection PdfDisarmer::Inspect(const std::string& data, std::uint64_t maxInflatedBytes) {
    Inspection inspection;
    std::string copy = data;
    WalkState st;
    inspection.wellFormed = Walk(copy, false, true, maxInflatedBytes, st);
    inspection.problem = st.problem;
    inspection.activeNames = st.found;
    inspection.hiddenInObjectStreams = st.hidden;
    inspection.encrypted = st.encrypted;
    return inspection;
}

domain::DisarmResult PdfDisarmer::Disarm(const std::string& inputPath, const std::string& outputPath,
                                         const Options& options) {
    return DisarmOnce(inputPath, outputPath, options, options.normalizeWithQpdf);
}

domain::DisarmResult PdfDisarmer::DisarmOnce(const std::string& inputPath, const std::string& outputPath,
                                             const Options& options, bool allowNormalization) {
    std::string data;
    if (!ReadAll(inputPath, data)) {
        return DisarmResult::Failed(inputPath, "Cannot read PDF");
    }

    auto header = data.find("%PDF-");
    if (header == std::string::npos || header >= 1024) {
        return DisarmResult::Failed(inputPath, "Missing PDF header");
    }
    std::size_t tailStart = data.size() > 4096 ? data.size() - 4096 : 0;
    if (data.find("%%EOF", tailStart) == std::string::npos) {
        return DisarmResult::Failed(inputPath, "Truncated PDF: no %%EOF marker");
    }

    std::string rewritten = data;
    WalkState st;
    if (!Walk(rewritten, true, true, options.maxInflatedBytes, st)) {
        return DisarmResult::Failed(inputPath, st.problem);
    }
    if (st.encrypted) {
        return DisarmResult::Failed(inputPath, "Encrypted PDF cannot be inspected");
    }
    if (st.hidden > 0) {
        if (allowNormalization) {
            return NormalizeAndDisarm(inputPath, outputPath, options);
        }
        return DisarmResult::Failed(inputPath, "Active content inside compressed object streams");
    }
    if (st.found.empty()) {
        return DisarmResult::PassThrough(inputPath);
    }

    WalkState verify;
    std::string check = rewritten;
    if (!Walk(check, false, true, options.maxInflatedBytes, verify) || !verify.found.empty() || verify.hidden > 0) {
        return DisarmResult::Failed(inputPath, "Neutralization incomplete");
    }

    {
        std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
        out.write(rewritten.data(), static_cast<std::streamsize>(rewritten.size()));
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(outputPath, ec);
            return DisarmResult::Failed(inputPath, "Cannot write neutralized PDF");
        }
    }

    DisarmResult result;
    result.originalRef = inputPath;
    result.neutralizedArtifact = outputPath;
    result.success = true;
    for (const auto& kv : st.found) {
        result.actions.insert(ActiveNames().at(kv.first));
    }
    std::cout << "[PdfDisarmer] Neutralized " << st.found.size() << " active name kinds in " << inputPath << std::endl;
    return result;
}

domain::DisarmResult PdfDisarmer::NormalizeAndDisarm(const std::string& inputPath, const std::string& outputPath,
                                                     const Options& options) {
    if (!ExternalTool::HasTool("qpdf")) {
        return DisarmResult::Failed(inputPath, "Active content in object streams and qpdf is unavailable");
    }

    ScopedWorkArea area(options.workDir, "pdf");
    if (!area.valid()) {
        return DisarmResult::Failed(inputPath, "Cannot create PDF work area");
    }
    std::string normalized = area.file(".pdf").string();

    // 0 = success, 3 = success with warnings.
    int rc = ExternalTool::Run("qpdf", {"--object-streams=disable", "--stream-data=uncompress",
                                        "--decode-level=generalized", inputPath, normalized});
    if (rc != 0 && rc != 3) {
        return DisarmResult::Failed(inputPath, "qpdf normalization failed with status " + std::to_string(rc));
    }

    DisarmResult result = DisarmOnce(normalized, outputPath, options, false);
    if (!result.success) {
        return DisarmResult::Failed(inputPath, "After normalization: " + result.detail);
    }
    if (!result.neutralizedArtifact) {
        std::error_code ec;
        fs::copy_file(normalized, outputPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return DisarmResult::Failed(inputPath, "Cannot write normalized PDF: " + ec.message());
        }
        result.neutralizedArtifact = outputPath;
    }
    result.originalRef = inputPath;
    result.actions.insert(NeutralizationAction::NormalizedObjectStreams);
    return result;
}

} // namespace filegate::infrastructure
