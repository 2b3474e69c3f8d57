#ifndef PLASMA_BACKUP_GUI_HPP_INCLUDED
#define PLASMA_BACKUP_GUI_HPP_INCLUDED
//
// gui.hpp
//
#include "gui-state.hpp"

namespace plasma_backup_gui
{
    void setupGUI(GuiState & state);
    void setupBackupWindow(GuiState & state);
    void setupRestoreWindow(GuiState & state);
    void setupInfoWindow(GuiState & state);
    void setupOutputWindow(GuiState & state);
    void setupStatusBlock(GuiState & state);
} // namespace plasma_backup_gui

#endif // PLASMA_BACKUP_GUI_HPP_INCLUDED
