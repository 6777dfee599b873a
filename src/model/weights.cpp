#include "../../include/model/weights.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace cpp_tagger {
namespace model {

using math::Tensor;

namespace {

constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
constexpr uint32_t MAX_ENTRIES = 50 * 1000 * 1000;

} // anonymous namespace

// =============================================================================
// WeightWriter Implementation
// =============================================================================

template<typename T>
void WeightWriter::write_value(std::ostream& stream, T value) {
    stream.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

void WeightWriter::write_string(std::ostream& stream, const std::string& str) {
    write_value<uint32_t>(stream, static_cast<uint32_t>(str.size()));
    stream.write(str.data(), static_cast<std::streamsize>(str.size()));
}

void WeightWriter::write_tensor(std::ostream& stream, const std::string& name,
                                const Tensor& tensor) {
    write_string(stream, name);
    write_value<uint32_t>(stream, static_cast<uint32_t>(tensor.ndim()));
    for (auto dim : tensor.shape()) {
        write_value<uint32_t>(stream, static_cast<uint32_t>(dim));
    }
    stream.write(reinterpret_cast<const char*>(tensor.data()),
                 static_cast<std::streamsize>(tensor.size() * sizeof(float)));
}

void WeightWriter::write_strings(std::ostream& stream, const std::vector<std::string>& items) {
    write_value<uint32_t>(stream, static_cast<uint32_t>(items.size()));
    for (const auto& item : items) {
        write_string(stream, item);
    }
}

void WeightWriter::save(const SavedModel& model, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open weight file for writing: " + path);
    }
    save(model, file);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write weight file: " + path);
    }
}

void WeightWriter::save(const SavedModel& model, std::ostream& stream) {
    // Refuse to write a file the loader would reject
    CellDimensions dims = model.parameters.dimensions();
    if (dims.vocab_size != model.vocab.size() || dims.tagset_size != model.tags.size()) {
        throw std::invalid_argument(
            "Parameters do not match vocabulary/tag set sizes (" +
            std::to_string(dims.vocab_size) + " vs " + std::to_string(model.vocab.size()) +
            ", " + std::to_string(dims.tagset_size) + " vs " +
            std::to_string(model.tags.size()) + ")");
    }

    write_value<uint32_t>(stream, WEIGHT_MAGIC);
    write_value<uint32_t>(stream, WEIGHT_VERSION);

    auto tensors = model.parameters.named_tensors();
    write_value<uint32_t>(stream, static_cast<uint32_t>(tensors.size()));
    for (const auto& named : tensors) {
        write_tensor(stream, named.first, *named.second);
    }

    write_string(stream, model.vocab.unk_token());
    write_strings(stream, model.vocab.tokens());
    write_strings(stream, model.tags.tags());

    if (!stream) {
        throw std::runtime_error("Failed to write weights to stream");
    }
}

// =============================================================================
// WeightLoader Implementation
// =============================================================================

template<typename T>
T WeightLoader::read_value(std::istream& stream) {
    T value;
    stream.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!stream) {
        throw std::runtime_error("Failed to read value from stream");
    }
    return value;
}

std::string WeightLoader::read_string(std::istream& stream) {
    uint32_t length = read_value<uint32_t>(stream);
    if (length > MAX_STRING_LENGTH) {
        throw std::runtime_error("String length exceeds maximum");
    }
    std::string str(length, '\0');
    if (length > 0) {
        stream.read(&str[0], length);
    }
    if (!stream) {
        throw std::runtime_error("Failed to read string from stream");
    }
    return str;
}

std::vector<std::string> WeightLoader::read_strings(std::istream& stream) {
    uint32_t count = read_value<uint32_t>(stream);
    if (count > MAX_ENTRIES) {
        throw std::runtime_error("String table size exceeds maximum");
    }

    // Grows as strings arrive; count is untrusted until they are read
    std::vector<std::string> items;
    for (uint32_t i = 0; i < count; ++i) {
        items.push_back(read_string(stream));
    }
    return items;
}

void WeightLoader::read_header(std::istream& stream) {
    uint32_t magic = read_value<uint32_t>(stream);
    if (magic != WEIGHT_MAGIC) {
        throw std::runtime_error("Invalid weight file magic number");
    }

    uint32_t version = read_value<uint32_t>(stream);
    if (version != WEIGHT_VERSION) {
        throw std::runtime_error("Unsupported weight file version: " + std::to_string(version));
    }
}

Tensor WeightLoader::read_tensor_body(std::istream& stream, const std::string& name) {
    uint32_t ndim = read_value<uint32_t>(stream);
    if (ndim == 0 || ndim > 2) {
        throw std::runtime_error("Invalid tensor dimensions for " + name + ": " +
                                 std::to_string(ndim));
    }

    Tensor::Shape shape(ndim);
    size_t total_size = 1;
    for (uint32_t i = 0; i < ndim; ++i) {
        uint32_t dim = read_value<uint32_t>(stream);
        if (dim == 0 || dim > MAX_ENTRIES) {
            throw std::runtime_error("Invalid tensor shape for " + name);
        }
        shape[i] = dim;
        total_size *= dim;
    }
    if (total_size > MAX_ENTRIES) {
        throw std::runtime_error("Tensor " + name + " exceeds maximum size");
    }

    std::vector<float> data(total_size);
    stream.read(reinterpret_cast<char*>(data.data()),
                static_cast<std::streamsize>(total_size * sizeof(float)));
    if (!stream) {
        throw std::runtime_error("Failed to read tensor data for: " + name);
    }
    return Tensor(shape, std::move(data));
}

SavedModel WeightLoader::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open weight file: " + path);
    }
    return load(file);
}

SavedModel WeightLoader::load(std::istream& stream) {
    read_header(stream);

    uint32_t num_tensors = read_value<uint32_t>(stream);
    std::unordered_map<std::string, Tensor> tensors;
    for (uint32_t i = 0; i < num_tensors; ++i) {
        std::string name = read_string(stream);
        Tensor body = read_tensor_body(stream, name);
        if (!tensors.emplace(name, std::move(body)).second) {
            throw std::runtime_error("Duplicate tensor: " + name);
        }
    }

    SavedModel model;

    std::string missing;
    for (auto& named : model.parameters.named_tensors()) {
        auto it = tensors.find(named.first);
        if (it == tensors.end()) {
            missing += (missing.empty() ? "" : ", ") + named.first;
            continue;
        }
        *named.second = std::move(it->second);
        tensors.erase(it);
    }
    if (!missing.empty()) {
        throw std::runtime_error("Missing tensors: " + missing);
    }
    if (!tensors.empty()) {
        std::string unexpected;
        for (const auto& entry : tensors) {
            unexpected += (unexpected.empty() ? "" : ", ") + entry.first;
        }
        throw std::runtime_error("Unexpected tensors: " + unexpected);
    }

    CellDimensions dims;
    try {
        dims = model.parameters.dimensions();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Inconsistent weight file: ") + e.what());
    }

    std::string unk_token = read_string(stream);
    std::vector<std::string> vocab_tokens = read_strings(stream);
    std::vector<std::string> tag_labels = read_strings(stream);

    try {
        model.vocab = corpus::Vocab::from_tokens(vocab_tokens, unk_token);
        model.tags = corpus::TagSet::from_tags(tag_labels);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid vocabulary in weight file: ") + e.what());
    }

    if (model.vocab.size() != dims.vocab_size) {
        throw std::runtime_error("Vocabulary size " + std::to_string(model.vocab.size()) +
                                 " does not match embedding rows " +
                                 std::to_string(dims.vocab_size));
    }
    if (model.tags.size() != dims.tagset_size) {
        throw std::runtime_error("Tag set size " + std::to_string(model.tags.size()) +
                                 " does not match projection rows " +
                                 std::to_string(dims.tagset_size));
    }

    return model;
}

SavedModel WeightLoader::load_from_memory(const char* data, size_t size) {
    std::string buffer(data, size);
    std::istringstream stream(buffer, std::ios::binary);
    return load(stream);
}

bool WeightLoader::validate(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    try {
        read_header(file);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace model
} // namespace cpp_tagger
