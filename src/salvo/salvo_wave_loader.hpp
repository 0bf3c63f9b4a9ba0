// salvo_wave_loader.hpp: Fetch-side guards and decoding for wave documents
//
// The transport is not ours: the host supplies a WaveFetcher that streams the
// response body into a sink. This header decides what may be fetched, how
// much of it is accepted, and how the text becomes Wave records.
//
//   auto waves = load_waves("https://levels.example/stage1.json5", fetcher);
//   if (waves.empty()) { /* stage runs without scripted spawns */ }
//
// Every failure (bad URL, transport error, oversize body, syntax error,
// invalid record) yields an empty list and one tagged line on stderr.
//
// Wave documents are JSON with // and /* */ comments and trailing commas.
//
// Depends: salvo_waves.hpp, nlohmann/json

#pragma once
#include "salvo_waves.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace salvo {

constexpr size_t MAX_WAVE_FILE_SIZE = 1024 * 1024;

// Only absolute http(s) URLs with a host. Rejects file:, data:, relative
// paths and anything else that would reach local resources.
inline bool is_allowed_wave_url(std::string_view url) {
	auto starts_with_nocase = [&](std::string_view prefix) {
		if (url.size() < prefix.size()) return false;
		for (size_t i = 0; i < prefix.size(); i++)
			if (std::tolower((unsigned char)url[i]) != prefix[i]) return false;
		return true;
	};
	size_t host_at;
	if (starts_with_nocase("https://"))     host_at = 8;
	else if (starts_with_nocase("http://")) host_at = 7;
	else return false;

	if (host_at >= url.size()) return false;
	char c = url[host_at];
	if (c == '/' || c == '?' || c == '#' || c == '@' || c == ':') return false;
	for (char ch : url)
		if ((unsigned char)ch <= 0x20 || ch == '\\') return false;
	return true;
}

// =============================================================================
// WaveFetchBuffer: accumulates a streamed body under a hard size limit
// =============================================================================
//
// append() returns false once the running total exceeds the limit; the
// buffer is then aborted and drops what it held. The caller must stop
// reading on the first false.

struct WaveFetchBuffer {
	size_t limit = MAX_WAVE_FILE_SIZE;
	size_t total = 0;
	bool aborted = false;
	std::string text;

	WaveFetchBuffer() = default;
	explicit WaveFetchBuffer(size_t max_bytes) : limit(max_bytes) {}

	bool append(const char* data, size_t n) {
		if (aborted) return false;
		total += n;
		if (total > limit) {
			aborted = true;
			text.clear();
			text.shrink_to_fit();
			return false;
		}
		text.append(data, n);
		return true;
	}
};

// Sink receives each chunk and returns false to cancel the transfer.
using WaveSink = std::function<bool(const char*, size_t)>;

// Returns false on transport failure (unreachable host, non-2xx status, ...).
using WaveFetcher = std::function<bool(const std::string& url, const WaveSink& sink)>;

// Remove commas that directly precede ']' or '}' (ignoring whitespace and
// comments in between). String contents are left alone.
inline std::string strip_trailing_commas(std::string_view src) {
	std::string out;
	out.reserve(src.size());
	size_t n = src.size();

	auto skip_ws_comments = [&](size_t i) {
		while (i < n) {
			char c = src[i];
			if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { i++; continue; }
			if (c == '/' && i + 1 < n && src[i + 1] == '/') {
				while (i < n && src[i] != '\n') i++;
				continue;
			}
			if (c == '/' && i + 1 < n && src[i + 1] == '*') {
				size_t end = src.find("*/", i + 2);
				i = (end == std::string_view::npos) ? n : end + 2;
				continue;
			}
			break;
		}
		return i;
	};

	for (size_t i = 0; i < n; i++) {
		char c = src[i];
		if (c == '"') {
			out.push_back(c);
			for (i++; i < n; i++) {
				out.push_back(src[i]);
				if (src[i] == '\\' && i + 1 < n) { out.push_back(src[++i]); continue; }
				if (src[i] == '"') break;
			}
			continue;
		}
		if (c == '/' && i + 1 < n && (src[i + 1] == '/' || src[i + 1] == '*')) {
			size_t end = skip_ws_comments(i);
			out.append(src.substr(i, end - i));
			i = end - 1;
			continue;
		}
		if (c == ',') {
			size_t next = skip_ws_comments(i + 1);
			if (next < n && (src[next] == ']' || src[next] == '}'))
				continue;
		}
		out.push_back(c);
	}
	return out;
}

// Decode JSON-with-comments text (wave documents, config files). Returns a
// discarded value on syntax errors.
inline nlohmann::json decode_document(std::string_view text) {
	std::string cleaned = strip_trailing_commas(text);
	return nlohmann::json::parse(cleaned, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
}

// Decode + validate text already in memory (level files shipped with the game).
inline std::vector<Wave> load_waves_text(std::string_view text, const WaveBounds& bounds = {}) {
	nlohmann::json doc = decode_document(text);
	if (doc.is_discarded()) {
		fprintf(stderr, "[loader] wave document is not valid JSON\n");
		return {};
	}
	return parse_waves(doc, bounds);
}

inline std::vector<Wave> load_waves(const std::string& url, const WaveFetcher& fetch,
                                    const WaveBounds& bounds = {},
                                    size_t max_bytes = MAX_WAVE_FILE_SIZE) {
	if (!is_allowed_wave_url(url)) {
		fprintf(stderr, "[loader] refusing wave url '%s'\n", url.c_str());
		return {};
	}
	if (!fetch) {
		fprintf(stderr, "[loader] no fetcher for '%s'\n", url.c_str());
		return {};
	}

	WaveFetchBuffer buf(max_bytes);
	bool ok = fetch(url, [&buf](const char* data, size_t n) { return buf.append(data, n); });
	if (buf.aborted) {
		fprintf(stderr, "[loader] '%s' exceeded %zu bytes\n", url.c_str(), max_bytes);
		return {};
	}
	if (!ok) {
		fprintf(stderr, "[loader] fetch failed for '%s'\n", url.c_str());
		return {};
	}
	return load_waves_text(buf.text, bounds);
}

} // namespace salvo
