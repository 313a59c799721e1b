/**
 * @file Serializer.hpp
 * @brief Run state machine turning one run's documents into an XDI file
 *
 * Lifecycle: IDLE --start--> OPEN --(descriptor|event)*--> OPEN --stop--> CLOSED.
 *
 * On start the template is loaded, the header buffer seeded, the output
 * opened and a provisional header written so the file is readable while
 * the run is in progress. Events from eligible descriptors append one row
 * each. On stop the header is resolved one last time and rewritten in
 * place, keeping every data row.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "xdi_export.hpp"
#include "../core/Document.hpp"
#include "../core/HeaderResolver.hpp"
#include "../core/Logger.hpp"
#include "../core/XdiTemplate.hpp"
#include "OutputManager.hpp"
#include "RowEmitter.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace xdi {

struct SerializerOptions {
    std::string file_prefix = "{uid}-";             ///< Rendered against the start document
    std::optional<std::string> template_text;        ///< Inline template, overrides the start document
    std::optional<std::string> template_path;        ///< Template file, overrides the start document
    DiagnosticCallback diagnostic_callback;          ///< Called for every recoverable condition
};

class Serializer {
public:
    /**
     * @brief Serializer writing files into a directory
     * @throws OutputError if the directory cannot be created
     */
    explicit Serializer(const std::filesystem::path& directory, SerializerOptions options = {});

    /**
     * @brief Serializer writing through a caller-supplied manager
     */
    explicit Serializer(std::shared_ptr<OutputManager> manager, SerializerOptions options = {});

    /**
     * @brief Closes the manager; an unfinished run keeps its provisional file
     */
    ~Serializer();

    Serializer(const Serializer&) = delete;
    Serializer& operator=(const Serializer&) = delete;

    /**
     * @brief Accept one (name, body) document
     *
     * resource, datum and datum_page are ignored; event_page is split into
     * one record per event.
     *
     * @throws DocumentError, SequenceError, ConfigError, RenderError, OutputError
     */
    void operator()(const std::string& name, const Json& body);

    /**
     * @brief Accept an already-parsed document
     */
    void on_document(const Document& document);

    ArtifactMap artifacts() const { return manager_->artifacts(); }

    /**
     * @brief Close the output manager
     * @throws OutputError if pending output could not be written
     */
    void close();

    RunState state() const { return state_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    const HeaderLineBuffer& header_lines() const { return resolver_.buffer(); }
    size_t rows_written() const { return rows_written_; }

    /**
     * @brief Id of the run's output artifact, once started
     */
    const std::optional<std::string>& artifact() const { return artifact_; }

private:
    void start(const RunStart& document);
    void descriptor(const EventDescriptor& document);
    void event(const Event& document);
    void stop(const RunStop& document);

    XdiTemplate load_template(const RunStart& document) const;
    void require_open(DocumentKind kind) const;
    void write(const std::string& text);
    void report(DiagnosticKind kind, const std::string& message);

    std::shared_ptr<OutputManager> manager_;
    SerializerOptions options_;
    Logger logger_;

    RunState state_ = RunState::IDLE;
    std::shared_ptr<const XdiTemplate> template_;
    HeaderResolver resolver_;
    std::unique_ptr<RowEmitter> row_emitter_;
    std::set<std::string> eligible_descriptors_;

    std::ostream* output_ = nullptr;
    std::optional<std::string> artifact_;
    size_t rows_written_ = 0;
    std::vector<Diagnostic> diagnostics_;
};

using NamedDocument = std::pair<std::string, Json>;

/**
 * @brief Drive a whole run through one Serializer writing into a directory
 * @return The artifacts produced
 */
ArtifactMap export_documents(const std::vector<NamedDocument>& documents,
                             const std::filesystem::path& directory,
                             const std::string& file_prefix = "{uid}-");

} // namespace xdi
