/**
 * @file Serializer.cpp
 * @brief Run state machine implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Serializer.hpp"
#include "Finalizer.hpp"
#include "MultiFileManager.hpp"
#include "PlaceholderRenderer.hpp"
#include "../core/XdiErrors.hpp"

#include <type_traits>

namespace xdi {

namespace {

const char* const CONFIG_SECTION = "suitcase-xdi";

std::string join_keys(const std::set<std::string>& keys) {
    std::string joined;
    for (const auto& key : keys) {
        if (!joined.empty()) joined += ", ";
        joined += key;
    }
    return joined;
}

} // namespace

Serializer::Serializer(const std::filesystem::path& directory, SerializerOptions options)
    : Serializer(std::make_shared<MultiFileManager>(directory), std::move(options)) {}

Serializer::Serializer(std::shared_ptr<OutputManager> manager, SerializerOptions options)
    : manager_(std::move(manager))
    , options_(std::move(options))
    , logger_("Serializer")
{
    if (!manager_) {
        throw OutputError("serializer requires an output manager");
    }
}

Serializer::~Serializer() {
    if (state_ == RunState::OPEN) {
        logger_.warning("Run abandoned before stop; " + artifact_.value_or("output") + " keeps its provisional header");
    }
    try {
        close();
    } catch (const XdiError& e) {
        logger_.error(e.what());
    }
}

void Serializer::operator()(const std::string& name, const Json& body) {
    if (is_ignored_document(name)) {
        logger_.debug("Ignoring " + name + " document");
        return;
    }
    for (const auto& document : parse_document(name, body)) {
        on_document(document);
    }
}

void Serializer::on_document(const Document& document) {
    logger_.detailed("Dispatching " + std::string(to_string(kind_of(document))) + " document in state " +
                     to_string(state_));

    std::visit([this](const auto& doc) {
        using T = std::decay_t<decltype(doc)>;
        if constexpr (std::is_same_v<T, RunStart>) {
            start(doc);
        } else if constexpr (std::is_same_v<T, EventDescriptor>) {
            descriptor(doc);
        } else if constexpr (std::is_same_v<T, Event>) {
            event(doc);
        } else {
            stop(doc);
        }
    }, document);
}

void Serializer::close() {
    manager_->close();
}

// ============================================================================
// Transitions
// ============================================================================

void Serializer::start(const RunStart& document) {
    if (state_ != RunState::IDLE) {
        throw SequenceError(std::string("start document received while run is ") + to_string(state_));
    }

    template_ = std::make_shared<const XdiTemplate>(load_template(document));
    resolver_.initialize(template_, document.body);
    row_emitter_ = std::make_unique<RowEmitter>(template_);

    std::string filename = PlaceholderRenderer::render_required(options_.file_prefix, document.body, "file prefix") +
                           ".xdi";
    output_ = &manager_->open(std::string(STREAM_DATA_LABEL), filename, OpenMode::EXCLUSIVE_CREATE);
    artifact_ = manager_->artifacts().at(std::string(STREAM_DATA_LABEL)).back();

    write(Finalizer::render_header_block(resolver_.buffer(), *template_));
    state_ = RunState::OPEN;

    logger_.info("Run " + document.uid + " opened " + *artifact_ + " (" +
                 std::to_string(resolver_.buffer().unresolved_count()) + " header fields pending)");
}

void Serializer::descriptor(const EventDescriptor& document) {
    require_open(DocumentKind::DESCRIPTOR);

    if (row_emitter_->is_eligible(document.data_keys)) {
        eligible_descriptors_.insert(document.uid);
        logger_.detailed("Descriptor " + document.uid + " is eligible for export");
    } else {
        logger_.detailed("Descriptor " + document.uid + " lacks some of the data keys [" +
                         join_keys(row_emitter_->required_data_keys()) + "]; its events are not exported");
    }

    resolver_.update(DocumentKind::DESCRIPTOR, document.body);
}

void Serializer::event(const Event& document) {
    require_open(DocumentKind::EVENT);

    // Header fields resolve from every record, exported or not
    resolver_.update(DocumentKind::EVENT, document.body);

    if (eligible_descriptors_.empty()) {
        report(DiagnosticKind::NO_ELIGIBLE_DESCRIPTOR,
               "no descriptor with data keys [" + join_keys(row_emitter_->required_data_keys()) +
               "] seen yet; event skipped");
        return;
    }
    if (eligible_descriptors_.count(document.descriptor) == 0) {
        report(DiagnosticKind::INELIGIBLE_RECORD,
               "event from descriptor " + document.descriptor + " has no data to export; event skipped");
        return;
    }

    std::string row = row_emitter_->render_row(document.body);
    write(row);
    ++rows_written_;
    logger_.trace("Row " + std::to_string(rows_written_) + " from " + document.descriptor + ": " +
                  row.substr(0, row.size() - 1));
}

void Serializer::stop(const RunStop& document) {
    require_open(DocumentKind::STOP);

    resolver_.update(DocumentKind::STOP, document.body);
    for (const auto& name : resolver_.unresolved_required()) {
        report(DiagnosticKind::UNRESOLVED_REQUIRED_HEADER,
               "required header '" + name + "' is unresolved at stop; written as " + std::string(UNRESOLVED_LITERAL));
    }

    output_->flush();
    size_t rows = Finalizer::rewrite(*manager_, *artifact_, Finalizer::render_header_block(resolver_.buffer(), *template_));
    output_ = nullptr;
    manager_->close();
    state_ = RunState::CLOSED;

    logger_.info("Run finished: " + *artifact_ + " with " + std::to_string(rows) + " data rows");
}

// ============================================================================
// Helpers
// ============================================================================

XdiTemplate Serializer::load_template(const RunStart& document) const {
    if (options_.template_text || options_.template_path) {
        return TemplateLoader::load(options_.template_text, options_.template_path);
    }

    const Json& body = document.body;
    auto md = body.find("md");
    const Json* section = nullptr;
    if (md != body.end() && md->is_object()) {
        auto it = md->find(CONFIG_SECTION);
        if (it != md->end() && it->is_object()) {
            section = &*it;
        }
    }
    if (section == nullptr) {
        throw ConfigError("configuration must be given as md[\"suitcase-xdi\"][\"config\"] "
                          "or md[\"suitcase-xdi\"][\"config-file-path\"] in the start document");
    }

    auto read_optional = [section](const char* key) -> std::optional<std::string> {
        auto it = section->find(key);
        if (it == section->end()) return std::nullopt;
        if (!it->is_string()) {
            throw ConfigError(std::string("md[\"suitcase-xdi\"][\"") + key + "\"] must be a string");
        }
        return it->get<std::string>();
    };

    return TemplateLoader::load(read_optional("config"), read_optional("config-file-path"));
}

void Serializer::require_open(DocumentKind kind) const {
    if (state_ != RunState::OPEN) {
        throw SequenceError(std::string(to_string(kind)) + " document received while run is " + to_string(state_));
    }
}

void Serializer::write(const std::string& text) {
    *output_ << text;
    output_->flush();
    if (!*output_) {
        throw OutputError("write to " + artifact_.value_or("output") + " failed");
    }
}

void Serializer::report(DiagnosticKind kind, const std::string& message) {
    logger_.warning(message);
    diagnostics_.push_back({kind, message});
    if (options_.diagnostic_callback) {
        options_.diagnostic_callback(diagnostics_.back());
    }
}

ArtifactMap export_documents(const std::vector<NamedDocument>& documents,
                             const std::filesystem::path& directory,
                             const std::string& file_prefix) {
    SerializerOptions options;
    options.file_prefix = file_prefix;

    Serializer serializer(directory, options);
    for (const auto& [name, body] : documents) {
        serializer(name, body);
    }
    serializer.close();
    return serializer.artifacts();
}

} // namespace xdi
