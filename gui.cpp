// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// gui.cpp
//
#include "gui.hpp"

#include "plasma-backup/str-util.hpp"

#include "imgui.h"
#include "imgui_stdlib.h"

#include <string>
#include <vector>

namespace plasma_backup_gui
{
    namespace
    {
        ImVec4 toImColor(const pb::Color color)
        {
            // clang-format off
            switch (color)
            {
                case pb::Color::Gray:   { return ImVec4(0.6f, 0.6f, 0.6f, 1.0f); }
                case pb::Color::Green:  { return ImVec4(0.0f, 1.0f, 0.0f, 1.0f); }
                case pb::Color::Yellow: { return ImVec4(1.0f, 1.0f, 0.0f, 1.0f); }
                case pb::Color::Red:    { return ImVec4(1.0f, 0.3f, 0.3f, 1.0f); }
                case pb::Color::Default:
                case pb::Color::Disabled:
                default:                { return ImVec4(1.0f, 1.0f, 1.0f, 1.0f); }
            }
            // clang-format on
        }

        void checkboxCategory(GuiState & state, const char * label, const pb::Category category)
        {
            bool isSelected{ state.categories.isSelected(category) };
            if (ImGui::Checkbox(label, &isSelected))
            {
                state.categories.select(category, isSelected);
            }
        }

        void textLabeled(const char * label, const std::string & value)
        {
            ImGui::Text("%s", label);
            ImGui::SameLine(160.0f);
            ImGui::TextUnformatted(value.c_str());
        }
    } // namespace

    void setupGUI(GuiState & state)
    {
        state.update();

        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
        setupBackupWindow(state);
        setupRestoreWindow(state);
        setupInfoWindow(state);
        setupOutputWindow(state);
    }

    void setupBackupWindow(GuiState & state)
    {
        ImGui::Begin("Backup");

        const bool isBusy{ state.isBusy() };

        if (isBusy)
        {
            ImGui::BeginDisabled();
        }

        ImGui::Text("Backup Options");
        checkboxCategory(state, "KDE Plasma Settings", pb::Category::KdeSettings);
        checkboxCategory(state, "Application Configs", pb::Category::AppConfigs);
        checkboxCategory(state, "Firefox Profiles", pb::Category::Firefox);
        checkboxCategory(state, "Thunderbird Profiles", pb::Category::Thunderbird);
        checkboxCategory(
            state,
            "User Directories (Documents, Pictures, Videos, Music, Downloads)",
            pb::Category::UserDirs);

        ImGui::Dummy(ImVec2(0.0f, 10.0f));

        ImGui::InputText("Backup Location", &state.backup_path);
        ImGui::Checkbox("Verbose", &state.opt_verbose);
        ImGui::SameLine();
        ImGui::Checkbox("Stop On First Error", &state.opt_strict);

        const bool wasButtonClicked = ImGui::Button("Start Backup", ImVec2(300.0f, 40.0f));

        if (isBusy)
        {
            ImGui::EndDisabled();
        }

        if (wasButtonClicked)
        {
            ImGui::OpenPopup("Confirm Backup");
        }

        if (ImGui::BeginPopupModal("Confirm Backup", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        {
            ImGui::Text("Create a backup in:\n%s", state.backup_path.c_str());

            if (ImGui::Button("Yes", ImVec2(120.0f, 0.0f)))
            {
                state.startBackup();
                ImGui::CloseCurrentPopup();
            }

            ImGui::SameLine();

            if (ImGui::Button("No", ImVec2(120.0f, 0.0f)))
            {
                ImGui::CloseCurrentPopup();
            }

            ImGui::EndPopup();
        }

        setupStatusBlock(state);

        ImGui::End();
    }

    void setupRestoreWindow(GuiState & state)
    {
        ImGui::Begin("Restore");

        const bool isBusy{ state.isBusy() };

        if (isBusy)
        {
            ImGui::BeginDisabled();
        }

        ImGui::InputText("Backup Path", &state.restore_path);

        if (ImGui::Button("List Available Backups") && !state.isListing())
        {
            state.requestBackupList();
        }

        if (state.isListing())
        {
            ImGui::SameLine();
            ImGui::TextColored(toImColor(pb::Color::Yellow), "Listing...");
        }

        if (ImGui::BeginListBox("##backups", ImVec2(-1.0f, 200.0f)))
        {
            const pb::BackupListingVec_t & listings{ state.listings() };
            for (std::size_t i(0); i < listings.size(); ++i)
            {
                const pb::BackupMetadata & md{ listings.at(i).metadata };

                const std::string label{ md.timestamp + "  -  " + md.hostname + "  (" +
                                         md.kde_version + ")##" + std::to_string(i) };

                const bool isSelected{ static_cast<int>(i) == state.selectedListing() };
                if (ImGui::Selectable(label.c_str(), isSelected))
                {
                    state.selectListing(i);
                }
            }

            ImGui::EndListBox();
        }

        ImGui::Checkbox("Restart Plasma After Restore", &state.opt_restart_plasma);

        ImGui::TextColored(
            toImColor(pb::Color::Yellow),
            "Warning: Restore will overwrite existing settings and data!");

        const bool wasButtonClicked = ImGui::Button("Start Restore", ImVec2(300.0f, 40.0f));

        if (isBusy)
        {
            ImGui::EndDisabled();
        }

        if (wasButtonClicked)
        {
            ImGui::OpenPopup("Confirm Restore");
        }

        if (ImGui::BeginPopupModal("Confirm Restore", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        {
            ImGui::Text(
                "Restore from:\n%s\n\nThis will overwrite your current settings!\n"
                "Firefox and Thunderbird profiles will be replaced entirely.",
                state.restore_path.c_str());

            if (ImGui::Button("Yes", ImVec2(120.0f, 0.0f)))
            {
                state.startRestore();
                ImGui::CloseCurrentPopup();
            }

            ImGui::SameLine();

            if (ImGui::Button("No", ImVec2(120.0f, 0.0f)))
            {
                ImGui::CloseCurrentPopup();
            }

            ImGui::EndPopup();
        }

        ImGui::End();
    }

    void setupInfoWindow(GuiState & state)
    {
        ImGui::Begin("System Info");

        if (state.hasSystemInfo())
        {
            const SystemInfo & info{ state.systemInfo() };
            textLabeled("Hostname:", info.hostname);
            textLabeled("User:", info.user);
            textLabeled("Home:", info.home);
            textLabeled("KDE:", info.kde_version);
            textLabeled("OS:", info.os_version);
        }
        else
        {
            ImGui::Text("Detecting...");
        }

        ImGui::Dummy(ImVec2(0.0f, 10.0f));
        textLabeled("Default Backup:", state.defaultBackupPath());

        ImGui::End();
    }

    void setupOutputWindow(GuiState & state)
    {
        ImGui::Begin("Output");

        if (ImGui::Button("Clear"))
        {
            state.clearOutput();
        }

        ImGui::Separator();

        ImGui::BeginChild(
            "##output", ImVec2(0.0f, 0.0f), false, ImGuiWindowFlags_HorizontalScrollbar);

        // only the visible lines are drawn
        const std::vector<OutputLine> & lines{ state.outputLines() };
        ImGuiListClipper clipper;
        clipper.Begin(static_cast<int>(lines.size()));
        while (clipper.Step())
        {
            for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i)
            {
                const OutputLine & line{ lines.at(static_cast<std::size_t>(i)) };
                ImGui::PushStyleColor(ImGuiCol_Text, toImColor(line.color));
                ImGui::TextUnformatted(line.text.c_str());
                ImGui::PopStyleColor();
            }
        }
        clipper.End();

        // keep following the newest line unless the user scrolled up
        if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        {
            ImGui::SetScrollHereY(1.0f);
        }

        ImGui::EndChild();
        ImGui::End();
    }

    void setupStatusBlock(GuiState & state)
    {
        ImGui::Dummy(ImVec2(0.0f, 10.0f));

        ImGui::Text("Status:  ");
        ImGui::SameLine();

        const Status status{ state.status() };
        if (status == Status::Cancelling)
        {
            ImGui::TextColored(toImColor(pb::Color::Red), "%s", toString(status));
        }
        else if (status == Status::Working)
        {
            ImGui::TextColored(toImColor(pb::Color::Yellow), "%s", toString(status));
        }
        else
        {
            ImGui::TextColored(toImColor(pb::Color::Default), "%s", toString(status));
        }

        if (status == Status::Working)
        {
            ImGui::SameLine();
            if (ImGui::Button("Cancel"))
            {
                state.cancel();
            }
        }

        if (!state.statusMessage().empty())
        {
            ImGui::TextColored(
                toImColor(state.statusColor()), "%s", state.statusMessage().c_str());
        }

        const pb::OutcomeCounter & counter{ state.counter() };
        ImGui::Text(
            "Copied: %zu  (%s)   Skipped: %zu",
            counter.copiedCount(),
            strutil::toNarrowString(pb::fileSizeToString(counter.copiedByteCount())).c_str(),
            counter.skippedCount());
    }

} // namespace plasma_backup_gui
