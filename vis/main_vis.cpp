// main_vis.cpp
// Live view of a simulated pneumatic limb driven through LimbEnv.
// - One env.step() + env.getObs() per frame while connected and "Drive" is on
// - Per-muscle contract / hold / loose selection, Loose All / Reset / Close
// - Contraction history per muscle, X axis locked to the visible window
// - Worker faults are shown with cause and trace; Connect starts over

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "Clock.h"
#include "LimbEnv.h"
#include "Log.h"
#include "SimulatedLimb.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

static void plot_line_with_xlimits(const char* title,
                                   const std::vector<const char*>& labels,
                                   const double* xs,
                                   const std::vector<std::vector<double>>& ys,
                                   int start,
                                   int count,
                                   double t0,
                                   double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title, ImVec2(-1, 320))) {
        // ImAxis_* is an enum, not a macro; needs ImPlot >= 0.13.
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, -0.1, 4.5, ImGuiCond_Once);
        for (std::size_t m = 0; m < ys.size() && m < labels.size(); ++m) {
            ImPlot::PlotLine(labels[m], xs + start, ys[m].data() + start, count);
        }
        ImPlot::EndPlot();
    }
}

struct VisualUIState {
    bool drive = true;
    float window_s = 10.0f;
    int muscles = 3;
    std::vector<int> selection;  // per muscle: 0 loose, 1 hold, 2 contract
    std::string last_error;
    std::string last_trace;
};

static double selectionToAction(int sel) {
    switch (sel) {
        case 0: return pneuma::kActionLoose;
        case 2: return pneuma::kActionContract;
        default: return pneuma::kActionHold;
    }
}

int main(int argc, char** argv) {
    int muscles = 3;
    pneuma::LogLevel level = pneuma::LogLevel::Warning;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--muscles" && i + 1 < argc) {
            muscles = std::max(1, std::min(pneuma::kMaxMuscles, std::atoi(argv[++i])));
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!pneuma::parseLogLevel(argv[++i], level)) {
                return fail("unknown --log-level (use debug|info|warning|error)");
            }
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Pneuma Limb Visualizer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- Limb + env ---
    pneuma::SimulatedLimb::Config sim_cfg;
    sim_cfg.muscles = muscles;
    pneuma::SimulatedLimb limb(sim_cfg);

    pneuma::LimbConfig cfg;
    cfg.log_level = level;
    pneuma::setLogRole("env");
    pneuma::LimbEnv env(cfg, limb.factory());

    VisualUIState ui;
    ui.muscles = muscles;
    ui.selection.assign(static_cast<std::size_t>(muscles), 0);

    std::vector<std::string> label_store;
    std::vector<const char*> labels;
    for (int m = 0; m < muscles; ++m) {
        label_store.push_back("muscle " + std::to_string(m));
    }
    for (const auto& s : label_store) labels.push_back(s.c_str());

    // History (bounded, oldest dropped first).
    const std::size_t kMaxSamples = 20000;
    std::vector<double> t_hist;
    std::vector<std::vector<double>> c_hist(static_cast<std::size_t>(muscles));
    std::vector<double> last_obs(static_cast<std::size_t>(muscles), 0.0);
    const double t_start = pneuma::monotonicNow_s();

    // Runs one LimbEnv operation; faults end up in the status panel.
    auto guarded = [&](const char* what, auto&& fn) {
        try {
            fn();
            return true;
        } catch (const pneuma::WorkerFaultError& e) {
            ui.last_error = std::string(what) + ": " + e.fault().worker + " worker fault: " + e.fault().cause;
            ui.last_trace = e.fault().trace;
        } catch (const pneuma::ControlError& e) {
            ui.last_error = std::string(what) + ": " + e.what();
            ui.last_trace.clear();
        } catch (const std::exception& e) {
            ui.last_error = std::string(what) + ": " + e.what();
            ui.last_trace.clear();
        }
        return false;
    };

    auto record = [&](const std::vector<double>& obs) {
        last_obs = obs;
        t_hist.push_back(pneuma::monotonicNow_s() - t_start);
        for (std::size_t m = 0; m < c_hist.size() && m < obs.size(); ++m) {
            c_hist[m].push_back(obs[m]);
        }
        if (t_hist.size() > kMaxSamples) {
            const std::size_t drop = t_hist.size() - kMaxSamples;
            t_hist.erase(t_hist.begin(), t_hist.begin() + static_cast<std::ptrdiff_t>(drop));
            for (auto& h : c_hist) h.erase(h.begin(), h.begin() + static_cast<std::ptrdiff_t>(drop));
        }
    };

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        if (env.isConnected() && ui.drive) {
            std::vector<double> actions(static_cast<std::size_t>(muscles));
            for (int m = 0; m < muscles; ++m) {
                actions[static_cast<std::size_t>(m)] = selectionToAction(ui.selection[static_cast<std::size_t>(m)]);
            }
            guarded("step", [&] {
                env.step(actions);
                record(env.getObs());
            });
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        const ImVec4 status_ok = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);

        ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(380, 560), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Limb Control")) {
            const pneuma::EnvState st = env.state();
            ImGui::Text("State: ");
            ImGui::SameLine();
            ImGui::TextColored(st == pneuma::EnvState::Connected ? status_ok : status_warn,
                               "%s", pneuma::envStateName(st));
            ImGui::Text("Pressure: %.2f bar (%s)", limb.pressure_bar(), limb.pressuregenOn() ? "on" : "off");
            try {
                ImGui::Text("Workers: comm %s, ctrl %s",
                            pneuma::workerStateName(env.commWorker().state()),
                            pneuma::workerStateName(env.ctrlWorker().state()));
            } catch (const pneuma::NotConnectedError&) {
                ImGui::TextDisabled("Workers: not started");
            }
            ImGui::Text("Log level: %s", pneuma::logLevelName(pneuma::logLevel()));

            if (!env.isConnected()) {
                if (ImGui::Button("Connect")) {
                    if (guarded("connect", [&] { env.connect(); })) {
                        ui.last_error.clear();
                        ui.last_trace.clear();
                    }
                }
            } else {
                if (ImGui::Button("Loose All")) guarded("looseAll", [&] { env.looseAll(); });
                ImGui::SameLine();
                if (ImGui::Button("Reset")) guarded("reset", [&] { record(env.reset()); });
                ImGui::SameLine();
                if (ImGui::Button("Close")) guarded("close", [&] { env.close(); });
                ImGui::SameLine();
                if (ImGui::Button("Force Close")) env.forceClose();
            }
            ImGui::Checkbox("Drive (step every frame)", &ui.drive);
            ImGui::SliderFloat("Window (s)", &ui.window_s, 1.0f, 60.0f, "%.0f");

            ImGui::Separator();
            for (int m = 0; m < muscles; ++m) {
                ImGui::PushID(m);
                int& sel = ui.selection[static_cast<std::size_t>(m)];
                ImGui::Text("M%-2d %.3f", m, last_obs[static_cast<std::size_t>(m)]);
                ImGui::SameLine();
                ImGui::RadioButton("loose", &sel, 0);
                ImGui::SameLine();
                ImGui::RadioButton("hold", &sel, 1);
                ImGui::SameLine();
                ImGui::RadioButton("contract", &sel, 2);
                ImGui::PopID();
            }

            ImGui::Separator();
            if (ImGui::Button("Inject read fault")) limb.injectReadFault("simulated sensor bus failure");
            ImGui::SameLine();
            if (ImGui::Button("Inject valve fault")) limb.injectActuationFault("simulated valve driver failure");
            if (ImGui::Button("Clear faults")) limb.clearFaults();

            if (env.isConnected()) {
                const pneuma::LimbEnv::Stats s = env.stats();
                ImGui::Text("steps %llu  comm cycles %llu  actuations %llu",
                            static_cast<unsigned long long>(s.steps),
                            static_cast<unsigned long long>(s.comm_cycles),
                            static_cast<unsigned long long>(s.ctrl_actuations));
            }

            if (!ui.last_error.empty()) {
                ImGui::Separator();
                ImGui::TextColored(status_fail, "%s", ui.last_error.c_str());
                if (!ui.last_trace.empty()) {
                    ImGui::TextWrapped("%s", ui.last_trace.c_str());
                }
            }
        }
        ImGui::End();

        ImGui::SetNextWindowPos(ImVec2(404, 12), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(860, 420), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Contraction")) {
            const int n = static_cast<int>(t_hist.size());
            const double t1 = n > 0 ? t_hist.back() : 0.0;
            const double t0 = std::max(0.0, t1 - static_cast<double>(ui.window_s));
            const int start = static_cast<int>(std::lower_bound(t_hist.begin(), t_hist.end(), t0) - t_hist.begin());
            ImGui::Text("Samples: %d   t = [%.2f, %.2f] s", n - start, t0, t1);
            plot_line_with_xlimits("Contraction", labels, t_hist.data(), c_hist, start, n - start, t0, t1);
        }
        ImGui::End();

        ImGui::Render();
        int display_w = 0, display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    if (env.isConnected()) {
        guarded("close", [&] { env.close(); });
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
