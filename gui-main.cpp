// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// gui-main.cpp
//
#include "gui.hpp"

#include "plasma-backup/config-file.hpp"
#include "plasma-backup/str-util.hpp"
#include "plasma-backup/system-info.hpp"
#include "plasma-backup/verified-output.hpp"

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_sdlrenderer3.h"

#include <SDL3/SDL.h>

#include <clocale>
#include <exception>
#include <string>

namespace plasma_backup_gui
{
    namespace
    {
        // Owns the SDL window and renderer and the ImGui context, in that order.
        class AppContext
        {
          public:
            explicit AppContext(pb::VerifiedOutput & output)
                : m_output(output)
                , m_window(nullptr)
                , m_renderer(nullptr)
                , m_isInitialized(false)
            {}

            ~AppContext() { shutdown(); }

            AppContext(const AppContext &) = delete;
            AppContext & operator=(const AppContext &) = delete;

            bool initialize()
            {
                if (!SDL_Init(SDL_INIT_VIDEO))
                {
                    printSdlError(L"SDL_Init() failed");
                    return false;
                }

                const SDL_WindowFlags windowFlags{ SDL_WINDOW_RESIZABLE |
                                                   SDL_WINDOW_HIGH_PIXEL_DENSITY };

                m_window = SDL_CreateWindow("Plasma Backup Manager", 1200, 800, windowFlags);
                if (m_window == nullptr)
                {
                    printSdlError(L"SDL_CreateWindow() failed");
                    shutdown();
                    return false;
                }

                m_renderer = SDL_CreateRenderer(m_window, nullptr);
                if (m_renderer == nullptr)
                {
                    printSdlError(L"SDL_CreateRenderer() failed");
                    shutdown();
                    return false;
                }

                SDL_SetRenderVSync(m_renderer, 1);

                IMGUI_CHECKVERSION();
                ImGui::CreateContext();
                ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_DockingEnable;
                ImGui::StyleColorsDark();

                // from here on shutdown() has the imgui backends to tear down
                m_isInitialized = true;

                if (!ImGui_ImplSDL3_InitForSDLRenderer(m_window, m_renderer) ||
                    !ImGui_ImplSDLRenderer3_Init(m_renderer))
                {
                    m_output.print(
                        L"Error: The ImGui SDL3 backends failed to start.", pb::Color::Red);
                    shutdown();
                    return false;
                }

                return true;
            }

            void shutdown()
            {
                if (m_isInitialized)
                {
                    ImGui_ImplSDLRenderer3_Shutdown();
                    ImGui_ImplSDL3_Shutdown();
                    ImGui::DestroyContext();
                    m_isInitialized = false;
                }

                if (m_renderer != nullptr)
                {
                    SDL_DestroyRenderer(m_renderer);
                    m_renderer = nullptr;
                }

                if (m_window != nullptr)
                {
                    SDL_DestroyWindow(m_window);
                    m_window = nullptr;
                }

                SDL_Quit();
            }

            // returns true if the window was closed
            bool processEvents()
            {
                bool willQuit{ false };

                SDL_Event event;
                while (SDL_PollEvent(&event))
                {
                    ImGui_ImplSDL3_ProcessEvent(&event);

                    if ((event.type == SDL_EVENT_QUIT) ||
                        ((event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) &&
                         (event.window.windowID == SDL_GetWindowID(m_window))))
                    {
                        willQuit = true;
                    }
                }

                return willQuit;
            }

            void beginFrame()
            {
                ImGui_ImplSDLRenderer3_NewFrame();
                ImGui_ImplSDL3_NewFrame();
                ImGui::NewFrame();
            }

            void endFrame()
            {
                ImGui::Render();
                SDL_SetRenderDrawColor(m_renderer, 30, 30, 30, 255);
                SDL_RenderClear(m_renderer);
                ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), m_renderer);
                SDL_RenderPresent(m_renderer);
            }

          private:
            void printSdlError(const std::wstring & what)
            {
                m_output.print(
                    L"Error: " + what + L":  " + strutil::toWideString(SDL_GetError()),
                    pb::Color::Red);
            }

          private:
            pb::VerifiedOutput & m_output;
            SDL_Window * m_window;
            SDL_Renderer * m_renderer;
            bool m_isInitialized;
        };

        int run(pb::VerifiedOutput & output)
        {
            const pb::Environment environment{ pb::detectEnvironment() };

            std::wstring configErrorMessage;
            const std::filesystem::path backupPath{ pb::resolveBackupPath(
                pb::Options(), environment, configErrorMessage) };

            if (!configErrorMessage.empty())
            {
                output.print(L"Warning:  " + configErrorMessage, pb::Color::Yellow);
            }

            AppContext context(output);
            if (!context.initialize())
            {
                return 1;
            }

            GuiState state(environment, backupPath, pb::defaultLogDir(environment));
            state.requestBackupList();

            while (!context.processEvents())
            {
                context.beginFrame();
                setupGUI(state);
                context.endFrame();
            }

            if (state.isBusy())
            {
                output.print(L"Cancelling the run in progress...", pb::Color::Yellow);
                state.cancel();
            }

            return 0;
        }
    } // namespace

} // namespace plasma_backup_gui

int main(int, char *[])
{
    // without this wcout can't show anything but plain ascii
    std::setlocale(LC_ALL, "");

    plasma_backup::VerifiedOutput output;
    output.color(plasma_backup::Options::isColorEnabledByDefault());

    try
    {
        return plasma_backup_gui::run(output);
    }
    catch (const std::exception & ex)
    {
        output.print(
            (L"Fatal Exception: \"" + strutil::toWideString(ex.what()) + L"\""),
            plasma_backup::Color::Red);
    }

    return 1;
}
