#ifndef CPP_TAGGER_MODEL_WEIGHTS_HPP
#define CPP_TAGGER_MODEL_WEIGHTS_HPP

#include "parameters.hpp"
#include "../corpus/vocab.hpp"
#include "../math/tensor.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <istream>
#include <ostream>

namespace cpp_tagger {
namespace model {

// Weight file format constants
constexpr uint32_t WEIGHT_MAGIC = 0x47544743; // "CGTG" in little-endian
constexpr uint32_t WEIGHT_VERSION = 1;

// Everything needed to rebuild a tagger
struct SavedModel {
    CellParameters parameters;
    corpus::Vocab vocab;
    corpus::TagSet tags;
};

// Binary layout, all integers uint32, floats as raw float32:
// [4 bytes] magic "CGTG"
// [4 bytes] version (1)
// [4 bytes] num_tensors
// For each tensor:
//   [4 bytes] name length
//   [N bytes] name
//   [4 bytes] num_dims (1 or 2)
//   [num_dims * 4 bytes] shape
//   [product(shape) * 4 bytes] float data
// [string]  unknown-word token
// [4 bytes] vocab_size, then vocab_size strings in id order
// [4 bytes] tagset_size, then tagset_size strings in id order
class WeightWriter {
public:
    // Throws std::runtime_error if the file cannot be written
    static void save(const SavedModel& model, const std::string& path);
    static void save(const SavedModel& model, std::ostream& stream);

private:
    static void write_string(std::ostream& stream, const std::string& str);
    static void write_tensor(std::ostream& stream, const std::string& name,
                             const math::Tensor& tensor);
    static void write_strings(std::ostream& stream, const std::vector<std::string>& items);

    template<typename T>
    static void write_value(std::ostream& stream, T value);
};

class WeightLoader {
public:
    // All loaders throw std::runtime_error on I/O or format errors,
    // including missing tensors and shapes that disagree with the
    // vocabulary or tag set
    static SavedModel load(const std::string& path);
    static SavedModel load(std::istream& stream);
    static SavedModel load_from_memory(const char* data, size_t size);

    // Checks magic and version without loading the tensors
    static bool validate(const std::string& path);

private:
    static void read_header(std::istream& stream);
    static math::Tensor read_tensor_body(std::istream& stream, const std::string& name);
    static std::string read_string(std::istream& stream);
    static std::vector<std::string> read_strings(std::istream& stream);

    template<typename T>
    static T read_value(std::istream& stream);
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_WEIGHTS_HPP
