#include "core/ResponseRenderer.hpp"

#include <iomanip>

#include "core/Constants.hpp"
#include "util/Strings.hpp"

namespace trackr {

namespace {

void labeled(std::ostream& out, const std::string& label, const std::string& value, size_t width) {
    out << std::left << std::setw(static_cast<int>(width)) << (label + ":") << value << "\n";
}

// First line inline after the label, the rest aligned under it
void labeledBlock(std::ostream& out, const std::string& label, const std::string& text, size_t width) {
    std::vector<std::string> lines = Strings::lines(text);
    if (lines.empty()) {
        labeled(out, label, "", width);
        return;
    }
    labeled(out, label, lines.front(), width);
    const std::string indent(width, ' ');
    for (size_t i = 1; i < lines.size(); ++i) {
        if (!lines[i].empty()) out << indent << lines[i];
        out << "\n";
    }
}

void indentedLines(std::ostream& out, const std::string& text, size_t indent) {
    const std::string pad(indent, ' ');
    for (const auto& line : Strings::lines(text)) {
        if (!line.empty()) out << pad << line;
        out << "\n";
    }
}

}

void ResponseRenderer::renderProject(std::ostream& out, const Project& project) {
    const size_t w = Constants::PROJECT_LABEL_WIDTH;
    labeled(out, "Name", project.name, w);
    labeled(out, "Point Scale", project.pointScale, w);
    if (project.iterationsStart) {
        labeled(out, "Iterations Start", *project.iterationsStart, w);
    }
    labeled(out, "Weeks per Iteration", std::to_string(project.weeksPerIteration), w);
    out << "\n";
}

void ResponseRenderer::renderStory(std::ostream& out, const Story& story, const DisplayOptions& display) {
    const size_t w = Constants::STORY_LABEL_WIDTH;
    out << "Story " << story.id << " (" << story.storyType << ") < " << story.url << " >\n";
    labeled(out, "Name", story.name, w);
    labeled(out, "Estimate", story.estimate ? std::to_string(*story.estimate) : "Unestimated", w);
    labeled(out, "State", story.currentState, w);
    if (story.description) {
        labeledBlock(out, "Description", *story.description, w);
    }
    labeled(out, "Requested By", story.requestedBy, w);
    if (story.ownedBy) {
        labeled(out, "Owned By", *story.ownedBy, w);
    }
    labeled(out, "Created", story.createdAt, w);
    if (story.deadline) {
        labeled(out, "Deadline", *story.deadline, w);
    }
    if (!story.labels.empty()) {
        labeled(out, "Label(s)", Strings::join(story.labels, ", "), w);
    }

    if (display.showNotes && !story.notes.empty()) {
        out << "Notes:\n";
        for (size_t i = 0; i < story.notes.size(); ++i) {
            const Note& note = story.notes[i];
            if (i > 0) out << "\n";
            out << "  " << note.author << " @ " << note.notedAt << "\n";
            indentedLines(out, note.text, Constants::NOTE_INDENT);
        }
    }
    out << "\n";
}

void ResponseRenderer::renderStories(std::ostream& out, const std::vector<Story>& stories,
                                     const DisplayOptions& display) {
    for (size_t i = 0; i < stories.size(); ++i) {
        if (i > 0) {
            out << std::string(Constants::DIVIDER_WIDTH, '=') << "\n\n";
        }
        renderStory(out, stories[i], display);
    }
}

void ResponseRenderer::renderNote(std::ostream& out, const Note& note) {
    out << "Note (" << note.id << ") " << note.author << " @ " << note.notedAt << "\n";
    indentedLines(out, note.text, 2);
}

void ResponseRenderer::renderMessage(std::ostream& out, const std::string& message) {
    out << message << "\n";
}

void ResponseRenderer::renderErrors(std::ostream& err, const std::vector<std::string>& errors) {
    err << ERROR_HEADER << "\n";
    for (const auto& e : errors) {
        err << "  " << e << "\n";
    }
}

}
