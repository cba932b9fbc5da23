#include "embedding_catalog.hpp"

#include "errors.hpp"
#include "lexical.hpp"
#include "vector_store.hpp"

#include <array>

namespace urlfeat {

namespace {

const std::array<EmbeddingFamily, 5>& families() {
    static const std::array<EmbeddingFamily, 5> table = {{
        {EmbeddingChoice::GLOVE, "GloVe", "", FallbackMode::MEAN},
        {EmbeddingChoice::CONCEPTNET, "Conceptnet", "/c/en/", FallbackMode::MEAN},
        {EmbeddingChoice::WORD2VEC, "Word2Vec", "", FallbackMode::MEAN},
        {EmbeddingChoice::FASTTEXT, "FastText", "", FallbackMode::ZERO},
        {EmbeddingChoice::SAMPLE, "sample", "", FallbackMode::MEAN},
    }};
    return table;
}

}

EmbeddingChoice parse_embedding_choice(const std::string& name) {
    const std::string lowered = to_lower(trim(name));
    for (const auto& family : families()) {
        if (to_lower(family.name) == lowered) {
            return family.choice;
        }
    }
    throw InvalidEmbeddingChoiceError(name);
}

const EmbeddingFamily& embedding_family(EmbeddingChoice choice) {
    for (const auto& family : families()) {
        if (family.choice == choice) {
            return family;
        }
    }
    throw InvalidEmbeddingChoiceError(std::to_string(static_cast<int>(choice)));
}

std::string to_string(EmbeddingChoice choice) {
    return embedding_family(choice).name;
}

std::shared_ptr<const EmbeddingIndex> load_embedding(EmbeddingChoice choice,
                                                     const std::string& path) {
    const auto& family = embedding_family(choice);
    if (choice == EmbeddingChoice::SAMPLE) {
        return InMemoryEmbeddingIndex::load(path, family.fallback);
    }
    return VectorStore::load(path, family.fallback);
}

}
