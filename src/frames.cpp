#include "frames.hpp"

#include <algorithm>
#include <cctype>

#include "decode.hpp"


namespace scanimate {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] auto is_digit(char const c) noexcept -> bool {
	return std::isdigit(static_cast<unsigned char>(c));
	}

[[nodiscard]] auto to_lower(std::string str) -> std::string {
	std::transform(str.begin(), str.end(), str.begin(), [](unsigned char const c) {
			return static_cast<char>(std::tolower(c));
			});
	return str;
	}

/// Return the run of digits starting at `pos`.
[[nodiscard]] auto digit_run(std::string_view const str, std::size_t const pos) noexcept
		-> std::string_view {
	auto end {pos};

	while (end < str.size() and is_digit(str[end])) {
		++end;
		}

	return str.substr(pos, end - pos);
	}

[[nodiscard]] auto strip_zeros(std::string_view const digits) noexcept -> std::string_view {
	return digits.substr(std::min(digits.find_first_not_of('0'), digits.size()));
	}

/// Return the extension of a path without its dot, lower-cased.
[[nodiscard]] auto extension_of(fs::path const& path) -> std::string {
	auto ext {path.extension().string()};

	if (not ext.empty() and ext.front() == '.') {
		ext.erase(0, 1);
		}

	return to_lower(std::move(ext));
	}

} // namespace


auto parse_extensions(std::string_view list) -> std::vector<std::string> {
	std::vector<std::string> result;

	while (not list.empty()) {
		auto const comma {std::min(list.find(','), list.size())};
		auto       entry {list.substr(0, comma)};
		list.remove_prefix(std::min(comma + 1, list.size()));

		// Trim whitespace and a leading dot.
		while (not entry.empty() and std::isspace(static_cast<unsigned char>(entry.front()))) {
			entry.remove_prefix(1);
			}
		while (not entry.empty() and std::isspace(static_cast<unsigned char>(entry.back()))) {
			entry.remove_suffix(1);
			}
		if (not entry.empty() and entry.front() == '.') {
			entry.remove_prefix(1);
			}

		if (entry.empty()) {
			continue;
			}

		auto ext {to_lower(std::string{entry})};

		if (std::find(result.begin(), result.end(), ext) == result.end()) {
			result.push_back(std::move(ext));
			}}

	return result;
	}

auto natural_less(std::string_view const lhs, std::string_view const rhs) noexcept -> bool {
	std::size_t l {0};
	std::size_t r {0};

	while (l < lhs.size() and r < rhs.size()) {
		if (is_digit(lhs[l]) and is_digit(rhs[r])) {
			auto const lhs_run {digit_run(lhs, l)};
			auto const rhs_run {digit_run(rhs, r)};

			// Compare by value: strip leading zeros, then a longer number is larger.
			auto const lhs_num {strip_zeros(lhs_run)};
			auto const rhs_num {strip_zeros(rhs_run)};

			if (lhs_num.size() != rhs_num.size()) {
				return lhs_num.size() < rhs_num.size();
				}
			if (lhs_num != rhs_num) {
				return lhs_num < rhs_num;
				}

			// Equal values, fewer leading zeros first.
			if (lhs_run.size() != rhs_run.size()) {
				return lhs_run.size() < rhs_run.size();
				}

			l += lhs_run.size();
			r += rhs_run.size();
			continue;
			}

		if (lhs[l] != rhs[r]) {
			return static_cast<unsigned char>(lhs[l]) < static_cast<unsigned char>(rhs[r]);
			}

		++l;
		++r;
		}

	return lhs.size() - l < rhs.size() - r;
	}

auto collect_files(
		fs::path const&                    dir,
		std::span<std::string const> const extensions,
		bool const                         recursive
		) -> std::vector<fs::path> {
	if (not fs::is_directory(dir)) {
		throw Error{ErrorKind::input_not_found, concat("Folder not found: ", dir)};
		}

	std::vector<fs::path> files;

	auto const consider {[&](fs::directory_entry const& entry) {
		if (not entry.is_regular_file()) {
			return;
			}

		auto const ext {extension_of(entry.path())};

		if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
			files.push_back(entry.path());
			}}};

	if (recursive) {
		for (auto const& entry : fs::recursive_directory_iterator{dir}) {
			consider(entry);
			}}
	else {
		for (auto const& entry : fs::directory_iterator{dir}) {
			consider(entry);
			}}

	// Sort by file name only; the full path breaks ties between equally named files.
	std::sort(files.begin(), files.end(), [](fs::path const& lhs, fs::path const& rhs) {
			auto const lhs_name {lhs.filename().string()};
			auto const rhs_name {rhs.filename().string()};

			if (lhs_name != rhs_name) {
				return natural_less(lhs_name, rhs_name);
				}

			return natural_less(lhs.string(), rhs.string());
			});

	return files;
	}

auto load_frames(std::span<fs::path const> const files) -> std::vector<Image> {
	std::vector<Image> frames;
	frames.reserve(files.size());

	for (auto const& file : files) {
		frames.push_back(read_frame(file));
		}

	return frames;
	}

} // namespace scanimate
