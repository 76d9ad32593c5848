#pragma once

#include <vigil/engine/refresh_inbox.h>

#include <filesystem>

namespace vigil::cli {

/**
 * Answers refresh requests from report files dropped by sources into a spool directory.
 * A source `id` for user `u` is read from `<spool>/<id>.<u>.json`; the file holds either a
 * report or `{"error": true}`. Sources without a file stay in flight until the timeout.
 */
class SpoolTransport final : public engine::SourceTransport {
public:
    explicit SpoolTransport(std::filesystem::path spoolDir);

    void setInbox(engine::RefreshInbox* inbox) noexcept { inbox_ = inbox; }

    void dispatch(const engine::RefreshPlan& plan) override;

    std::filesystem::path reportPath(const core::SourceKey& key) const;

private:
    std::filesystem::path spoolDir_;
    engine::RefreshInbox* inbox_{nullptr};
};

} // namespace vigil::cli
