#include "contactwindow.h"
#include "contactstore.h"

#include <QFileDialog>
#include <QFont>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSignalBlocker>
#include <QTableWidget>
#include <QTableWidgetItem>
#include <QVBoxLayout>

namespace {
enum Col { ColName = 0, ColPhone, ColEmail, ColAddress, ColCount };
constexpr int kIdRole = Qt::UserRole + 1;
}

static QString errorTitle(ContactError::Kind k) {
    switch (k) {
    case ContactError::Kind::MissingField:     return QObject::tr("Missing Fields");
    case ContactError::Kind::InvalidPhone:     return QObject::tr("Invalid Phone");
    case ContactError::Kind::InvalidEmail:     return QObject::tr("Invalid Email");
    case ContactError::Kind::DuplicateKey:     return QObject::tr("Duplicate");
    case ContactError::Kind::NoSelection:      return QObject::tr("No Selection");
    case ContactError::Kind::PersistenceError: return QObject::tr("Save Error");
    case ContactError::Kind::ImportError:      return QObject::tr("Import Error");
    case ContactError::Kind::None:             break;
    }
    return QObject::tr("Contact Manager");
}

ContactWindow::ContactWindow(ContactStore& store, QWidget* parent)
    : QWidget(parent), store_(store)
{
    setWindowTitle(tr("Contact Manager"));
    setMinimumSize(820, 520);

    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(12, 10, 12, 6);
    root->setSpacing(8);

    // ---- Barra superior: título + importar/exportar ----
    auto* top = new QHBoxLayout;
    auto* title = new QLabel(tr("Contact Manager"));
    QFont tf = title->font(); tf.setPointSize(16); tf.setBold(true);
    title->setFont(tf);
    auto* btnImport = new QPushButton(tr("Import JSON"));
    auto* btnExport = new QPushButton(tr("Export JSON"));
    top->addWidget(title);
    top->addStretch(1);
    top->addWidget(btnImport);
    top->addWidget(btnExport);
    root->addLayout(top);

    auto* main = new QHBoxLayout;
    root->addLayout(main, 1);

    // ---- Izquierda: formulario ----
    auto* card = new QGroupBox(tr("Contact Details"));
    auto* cv = new QVBoxLayout(card);
    auto* fl = new QFormLayout;
    fl->setRowWrapPolicy(QFormLayout::WrapAllRows);
    leName_    = new QLineEdit;
    lePhone_   = new QLineEdit;
    leEmail_   = new QLineEdit;
    teAddress_ = new QPlainTextEdit;
    teAddress_->setTabChangesFocus(true);
    fl->addRow(tr("Store Name *"), leName_);
    fl->addRow(tr("Phone *"),      lePhone_);
    fl->addRow(tr("Email"),        leEmail_);
    fl->addRow(tr("Address"),      teAddress_);
    cv->addLayout(fl, 1);

    auto* fb = new QHBoxLayout;
    auto* btnAdd    = new QPushButton(tr("Add New"));
    auto* btnUpdate = new QPushButton(tr("Update Selected"));
    auto* btnClear  = new QPushButton(tr("Clear Form"));
    auto* btnDelete = new QPushButton(tr("Delete Selected"));
    fb->addWidget(btnAdd);
    fb->addWidget(btnUpdate);
    fb->addWidget(btnClear);
    fb->addWidget(btnDelete);
    cv->addLayout(fb);
    main->addWidget(card, 0);

    // ---- Derecha: búsqueda + tabla ----
    auto* right = new QVBoxLayout;
    auto* sb = new QHBoxLayout;
    leSearch_ = new QLineEdit;
    leSearch_->setPlaceholderText(tr("Name or phone"));
    auto* btnClearSearch = new QPushButton(tr("Clear"));
    sb->addWidget(new QLabel(tr("Search (Name or Phone):")));
    sb->addWidget(leSearch_, 1);
    sb->addWidget(btnClearSearch);
    right->addLayout(sb);

    table_ = new QTableWidget(0, ColCount);
    table_->setHorizontalHeaderLabels({ tr("Name"), tr("Phone"), tr("Email"), tr("Address") });
    table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    table_->setSelectionMode(QAbstractItemView::SingleSelection);
    table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table_->verticalHeader()->setVisible(false);
    table_->horizontalHeader()->setStretchLastSection(true);
    table_->setColumnWidth(ColName, 160);
    table_->setColumnWidth(ColPhone, 120);
    table_->setColumnWidth(ColEmail, 180);
    right->addWidget(table_, 1);
    main->addLayout(right, 1);

    // ---- Pie ----
    auto* footer = new QHBoxLayout;
    auto* hint = new QLabel(tr("Tip: Double-click a row to load it into the form for quick edits. *Required fields"));
    hint->setStyleSheet("color: #555;");
    lblStatus_ = new QLabel;
    footer->addWidget(hint, 1);
    footer->addWidget(lblStatus_);
    root->addLayout(footer);

    connect(btnImport, &QPushButton::clicked, this, &ContactWindow::importJson);
    connect(btnExport, &QPushButton::clicked, this, &ContactWindow::exportJson);
    connect(btnAdd,    &QPushButton::clicked, this, &ContactWindow::addContact);
    connect(btnUpdate, &QPushButton::clicked, this, &ContactWindow::updateContact);
    connect(btnClear,  &QPushButton::clicked, this, &ContactWindow::clearForm);
    connect(btnDelete, &QPushButton::clicked, this, &ContactWindow::deleteSelected);
    connect(btnClearSearch, &QPushButton::clicked, leSearch_, &QLineEdit::clear);
    connect(leSearch_, &QLineEdit::textChanged, this, &ContactWindow::onSearchChanged);
    connect(table_, &QTableWidget::itemSelectionChanged, this, &ContactWindow::onSelectionChanged);
    connect(table_, &QTableWidget::itemDoubleClicked, this, &ContactWindow::onItemDoubleClicked);
    connect(&store_, &ContactStore::contactsChanged, this, &ContactWindow::refreshTable);

    refreshTable();
}

void ContactWindow::loadContacts() {
    ContactError err;
    if (!store_.reload(&err))
        QMessageBox::warning(this, tr("Load Error"), err.message);
}

/* =================== Formulario =================== */

Contact ContactWindow::readForm() const {
    return Contact{ leName_->text(), lePhone_->text(), leEmail_->text(),
                    teAddress_->toPlainText() }.trimmed();
}

void ContactWindow::fillForm(const Contact& c) {
    leName_->setText(c.name);
    lePhone_->setText(c.phone);
    leEmail_->setText(c.email);
    teAddress_->setPlainText(c.address);
}

void ContactWindow::clearForm() {
    leName_->clear();
    lePhone_->clear();
    leEmail_->clear();
    teAddress_->clear();
    leName_->setFocus();
}

void ContactWindow::showError(const ContactError& e) {
    switch (e.kind) {
    case ContactError::Kind::DuplicateKey:
    case ContactError::Kind::NoSelection:
        QMessageBox::information(this, errorTitle(e.kind), e.message);
        break;
    case ContactError::Kind::PersistenceError:
    case ContactError::Kind::ImportError:
        QMessageBox::critical(this, errorTitle(e.kind), e.message);
        break;
    default:
        QMessageBox::warning(this, errorTitle(e.kind), e.message);
        break;
    }
}

/* =================== Tabla / búsqueda =================== */

void ContactWindow::refreshTable() {
    const QVector<ContactEntry>& rows = filter_.apply(store_, leSearch_->text());

    QSignalBlocker block(table_);
    table_->clearSelection();
    table_->clearContents();
    table_->setRowCount(rows.size());
    for (int r = 0; r < rows.size(); ++r) {
        const Contact& c = rows[r].contact;
        const QString cells[ColCount] = { c.name, c.phone, c.email, c.address };
        for (int col = 0; col < ColCount; ++col) {
            auto* it = new QTableWidgetItem(cells[col]);
            it->setData(kIdRole, rows[r].id);
            table_->setItem(r, col, it);
        }
    }
    selected_ = kNoContact;   // la vista cambió: la selección se limpia

    lblStatus_->setText(tr("%1 of %2 contacts").arg(rows.size()).arg(store_.count()));
}

void ContactWindow::onSearchChanged(const QString&) {
    refreshTable();
}

void ContactWindow::onSelectionChanged() {
    const auto items = table_->selectedItems();
    selected_ = items.isEmpty() ? kNoContact : items.first()->data(kIdRole).toLongLong();
}

void ContactWindow::onItemDoubleClicked(QTableWidgetItem* item) {
    if (!item) return;
    if (const Contact* c = store_.find(item->data(kIdRole).toLongLong()))
        fillForm(*c);
}

/* =================== CRUD =================== */

void ContactWindow::addContact() {
    ContactError err;
    if (!store_.add(readForm(), &err)) {
        showError(err);
        // Un fallo al guardar deja el registro en memoria: el formulario ya cumplió
        if (err.kind != ContactError::Kind::PersistenceError) return;
    }
    clearForm();
}

void ContactWindow::updateContact() {
    ContactError err;
    if (!store_.update(selected_, readForm(), &err)) {
        showError(err);
        if (err.kind != ContactError::Kind::PersistenceError) return;
    }
    clearForm();
}

void ContactWindow::deleteSelected() {
    ContactError err;
    const auto confirm = [this](const Contact& c) {
        return QMessageBox::question(this, tr("Confirm Delete"),
                                     tr("Delete contact '%1'?").arg(c.name),
                                     QMessageBox::Yes | QMessageBox::No,
                                     QMessageBox::No) == QMessageBox::Yes;
    };
    if (!store_.remove(selected_, confirm, &err)) {
        if (!err.isError()) return;   // cancelado por el usuario
        showError(err);
        if (err.kind != ContactError::Kind::PersistenceError) return;
    }
    clearForm();
}

/* =================== Importar / exportar =================== */

void ContactWindow::exportJson() {
    const QString file = QFileDialog::getSaveFileName(this, tr("Export Contacts"),
                                                      "contacts_export.json",
                                                      tr("JSON Files (*.json)"));
    if (file.isEmpty()) return;

    ContactError err;
    if (!store_.exportTo(file, &err)) {
        QMessageBox::critical(this, tr("Export Error"), err.message);
        return;
    }
    QMessageBox::information(this, tr("Exported"), tr("Contacts exported to:\n%1").arg(file));
}

void ContactWindow::importJson() {
    const QString file = QFileDialog::getOpenFileName(this, tr("Import Contacts"), QString(),
                                                      tr("JSON Files (*.json)"));
    if (file.isEmpty()) return;

    ContactError err;
    const int added = store_.importMerge(file, &err);
    if (added < 0 || err.isError()) {
        showError(err);
        if (added < 0) return;
    }
    QMessageBox::information(this, tr("Imported"), tr("Imported %1 contacts.").arg(added));
}
