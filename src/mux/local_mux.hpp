#pragma once

// =============================================================================
// local_mux.hpp — in-process multiplexer
// =============================================================================
// Windows of tabs of panes, all living in this process. Panes of a tab are
// laid out side by side with a one-column separator; a zoomed tab shows only
// its active pane. Panes are created as BufferPanes; spawn_tab's command is
// used as the title, the content is fed by the caller.
// =============================================================================

#include "buffer_pane.hpp"
#include "mux.hpp"

#include <map>
#include <memory>
#include <vector>

namespace termwin
{

    class LocalMux;

    class LocalTab : public Tab
    {
    public:
        LocalTab(LocalMux &mux, TabId tab_id, const PtySize &size);

        TabId tab_id() const override { return tab_id_; }
        std::shared_ptr<Pane> get_active_pane() const override;
        void set_active_pane(PaneId pane_id) override;
        std::vector<PositionedPane> iter_panes() const override;
        PtySize get_size() const override { return size_; }
        void resize(const PtySize &size) override;
        std::size_t count_panes() const override { return panes_.size(); }
        void kill_pane(PaneId pane_id) override;
        bool can_close_without_prompting() const override;
        void toggle_zoom() override;
        bool is_zoomed() const { return zoomed_; }
        const std::vector<std::shared_ptr<Pane>> &panes() const { return panes_; }

        /// Add a pane to the right of the existing ones and make it active.
        void split(std::shared_ptr<Pane> pane);

        /// Drop `pane_id` from the layout without killing it. Returns true
        /// when it was part of this tab.
        bool detach_pane(PaneId pane_id);

    private:
        LocalMux &mux_;
        TabId tab_id_;
        PtySize size_;
        std::vector<std::shared_ptr<Pane>> panes_;
        std::size_t active_ = 0;
        bool zoomed_ = false;

        void relayout();
    };

    class LocalWindow : public MuxWindow
    {
    public:
        std::size_t len() const override { return tabs_.size(); }
        std::size_t get_active_idx() const override { return active_; }
        void set_active(std::size_t idx) override;
        std::shared_ptr<Tab> get_by_idx(std::size_t idx) const override;
        std::shared_ptr<Tab> remove_by_idx(std::size_t idx) override;
        void insert(std::size_t idx, std::shared_ptr<Tab> tab) override;
        std::vector<std::shared_ptr<Tab>> tabs() const override { return tabs_; }
        bool check_and_reset_invalidated() override;
        void invalidate() override { invalidated_ = true; }

        void push(std::shared_ptr<Tab> tab);

        /// Index of `tab_id`, or len() when absent.
        std::size_t idx_by_id(TabId tab_id) const;

    private:
        std::vector<std::shared_ptr<Tab>> tabs_;
        std::size_t active_ = 0;
        bool invalidated_ = false;
    };

    class LocalMux : public Mux
    {
    public:
        MuxWindowId new_window();

        MuxWindow *get_window(MuxWindowId window_id) override;
        std::shared_ptr<Tab> get_active_tab_for_window(MuxWindowId window_id) override;
        std::shared_ptr<Pane> get_pane(PaneId pane_id) const override;

        PaneId allocate_pane_id() override { return next_pane_id_++; }
        void add_pane(std::shared_ptr<Pane> pane) override;
        void remove_pane(PaneId pane_id) override;
        void remove_tab(TabId tab_id) override;
        void kill_window(MuxWindowId window_id) override;

        std::shared_ptr<Tab> spawn_tab(MuxWindowId window_id, const std::string &command,
                                       const PtySize &size) override;

        /// Split the active tab of a window with a fresh BufferPane.
        std::shared_ptr<BufferPane> split_active_tab(MuxWindowId window_id,
                                                     const std::string &command);

        /// How many times a pane was released; used to check exactly-once
        /// release of overlay panes.
        std::size_t release_count(PaneId pane_id) const;

    private:
        std::map<MuxWindowId, std::unique_ptr<LocalWindow>> windows_;
        std::map<TabId, std::shared_ptr<LocalTab>> tabs_;
        std::map<PaneId, std::shared_ptr<Pane>> panes_;
        std::map<PaneId, std::size_t> released_;
        MuxWindowId next_window_id_ = 0;
        TabId next_tab_id_ = 0;
        PaneId next_pane_id_ = 0;

        void forget_pane(PaneId pane_id);
        void forget_tab(TabId tab_id);
    };

} // namespace termwin
