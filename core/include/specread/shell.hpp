#pragma once

#include "types.hpp"
#include "view/plot_model.hpp"
#include <optional>
#include <string>

namespace specread {

/**
 * @brief Display layer the core talks to.
 *
 * Implemented by the front end (dialog application, console tool, tests).
 */
class Shell {
public:
    virtual ~Shell() = default;

    /**
     * @brief Ask the user for the delimiter of a file.
     *
     * Only called when no delimiter could be detected.
     *
     * @param display_name File base name
     * @return Delimiter, or std::nullopt if the user declined
     */
    virtual std::optional<std::string> promptDelimiter(const std::string& display_name) = 0;

    /**
     * @brief Show an error or warning to the user.
     */
    virtual void reportError(ErrorKind kind, const std::string& message) = 0;

    /**
     * @brief Draw a prepared plot.
     */
    virtual void renderSpectra(const view::PlotModel& model) = 0;
};

} // namespace specread
