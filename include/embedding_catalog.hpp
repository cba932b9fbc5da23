#pragma once

#include <memory>
#include <string>

#include "embedding_index.hpp"

namespace urlfeat {

enum class EmbeddingChoice {
    GLOVE,
    CONCEPTNET,
    WORD2VEC,
    FASTTEXT,
    SAMPLE
};

struct EmbeddingFamily {
    EmbeddingChoice choice;
    std::string name;
    std::string prefix;       // prepended to every token before lookup
    FallbackMode fallback;
};

// Case-insensitive; throws InvalidEmbeddingChoiceError for unknown names
EmbeddingChoice parse_embedding_choice(const std::string& name);

const EmbeddingFamily& embedding_family(EmbeddingChoice choice);

std::string to_string(EmbeddingChoice choice);

// Loads the vectors of a family from path (sample table or vector store)
std::shared_ptr<const EmbeddingIndex> load_embedding(EmbeddingChoice choice,
                                                     const std::string& path);

}
