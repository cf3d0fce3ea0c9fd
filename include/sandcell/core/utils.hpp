#ifndef sandcell_CORE_UTILS_HPP
#define sandcell_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sandcell {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on the monotonic clock (for deadlines and durations)
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Replace invalid UTF-8 sequences with U+FFFD so the text can be
// serialized as JSON. Valid text, control characters included, is unchanged.
std::string sanitize_utf8(const std::string& s);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Recursively delete a directory and everything below it.
// Symlinks are removed, never followed.
bool remove_directory_tree(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Encoding utilities ============

// Standard base64 (RFC 4648) with padding, no line breaks
std::string base64_encode(const unsigned char* data, size_t len);
std::string base64_encode(const std::string& data);

// Decode standard base64. Returns false on malformed input.
bool base64_decode(const std::string& encoded, std::string& out);

} // namespace sandcell

#endif // sandcell_CORE_UTILS_HPP
